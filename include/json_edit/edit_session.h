// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file edit_session.h
/// @brief Edit-save cycle for one selected node of a JSON document.
///
/// EditSession keeps the UI state of a node editor in a lager store:
/// - the selected node (its field rows and path)
/// - the editable text, seeded from normalize_node_rows()
/// - the open/editing flags
///
/// The document itself is never cached. It belongs to the host, which hands it
/// over through EditSessionCollaborators at save time:
///
/// ```cpp
/// std::string document = R"({"customer": [{"id": 1, "name": "Ada"}]})";
/// EditSession session{{
///     .get_document_text = [&] { return document; },
///     .set_document_text = [&](const std::string& text) { document = text; },
///     .set_contents      = [](const FileContents&) {},
///     .notify            = [](const Notification& n) { std::cout << n.message << "\n"; },
/// }};
///
/// session.select_path({"customer", std::size_t{0}});
/// session.open();
/// session.begin_edit();
/// session.change_text(R"({"id": 2, "name": "Ada"})");
/// session.save();   // document now holds id 2
/// ```

#pragma once

#include "api.h"
#include "node_rows.h"
#include "path.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace json_edit {

// ============================================================
// Collaborators
// ============================================================

/// Persisted-contents update handed to the file store
struct FileContents {
    std::string contents;
    bool has_changes = false;
    bool skip_update = false;
};

enum class NotificationKind { Success, Error };

struct Notification {
    NotificationKind kind = NotificationKind::Success;
    std::string message;
};

/// Host callbacks. All four are required by save(); get_document_text is
/// also used by select_path().
struct EditSessionCollaborators {
    std::function<std::string()> get_document_text;
    std::function<void(const std::string&)> set_document_text;
    std::function<void(const FileContents&)> set_contents;
    std::function<void(const Notification&)> notify;
};

// ============================================================
// Model
// ============================================================

struct SelectedNode {
    FieldRows rows;
    Path path;

    bool operator==(const SelectedNode&) const = default;
};

struct EditSessionModel {
    std::optional<SelectedNode> selected;
    std::string edited_text;
    std::string path_text = "$";
    bool is_open = false;
    bool is_editing = false;
    bool close_requested = false;  ///< set by a successful save; the host closes the view
    std::string last_error;

    bool operator==(const EditSessionModel&) const = default;
};

// ============================================================
// Actions
// ============================================================

namespace actions {

struct Open {};
struct Close {};
struct SelectNode {
    SelectedNode node;
};
struct BeginEdit {};
struct ChangeText {
    std::string text;
};
struct CancelEdit {};
struct SaveSucceeded {};
struct SaveFailed {
    std::string message;
};

} // namespace actions

using EditSessionAction = std::variant<actions::Open,
                                       actions::Close,
                                       actions::SelectNode,
                                       actions::BeginEdit,
                                       actions::ChangeText,
                                       actions::CancelEdit,
                                       actions::SaveSucceeded,
                                       actions::SaveFailed>;

/// Pure reducer. Opening or selecting reseeds the text from the selected
/// node and leaves edit mode; text changes are only taken while editing.
[[nodiscard]] JSON_EDIT_API EditSessionModel edit_session_update(EditSessionModel model,
                                                                 EditSessionAction action);

// ============================================================
// EditSession
// ============================================================

inline constexpr const char* kSaveSucceededMessage = "Changes saved successfully!";
inline constexpr const char* kInvalidJsonMessage = "Invalid JSON format. Please check your input.";
inline constexpr const char* kNoNodeSelectedMessage = "No node selected";

class JSON_EDIT_API EditSession {
public:
    using WatchCallback = std::function<void(const EditSessionModel&)>;

    explicit EditSession(EditSessionCollaborators collaborators);
    ~EditSession();

    EditSession(const EditSession&) = delete;
    EditSession& operator=(const EditSession&) = delete;

    void dispatch(EditSessionAction action);

    [[nodiscard]] const EditSessionModel& get_model() const;

    void open();
    void close();
    void select_node(SelectedNode node);

    /// Select the node at @p path of the current document, building its rows
    /// from the document. Returns false when the document does not parse or
    /// the path does not exist.
    bool select_path(Path path);

    void begin_edit();
    void change_text(std::string text);
    void cancel_edit();

    /// Merge the edited text into the document and publish the result.
    /// Returns false and notifies an error when the merged text does not parse
    /// or a collaborator throws. Writes made before the throw are not undone.
    bool save();

    /// Called after every model change
    void watch(WatchCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace json_edit
