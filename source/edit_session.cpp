// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file edit_session.cpp
/// @brief Node edit session backed by a lager store.

#include <json_edit/edit_session.h>
#include <json_edit/node_update.h>
#include <json_edit/path_core.h>
#include <json_edit/serialization.h>

#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>
#include <lager/watch.hpp>

#include <exception>
#include <string>

namespace json_edit {

// ============================================================
// Reducer
// ============================================================

namespace {

/// Reset the editable text and path display from the selected node
void reseed_from_selection(EditSessionModel& model)
{
    if (model.selected) {
        model.edited_text = normalize_node_rows(model.selected->rows);
        model.path_text = path_to_json_path(model.selected->path);
    }
    model.is_editing = false;
}

} // anonymous namespace

EditSessionModel edit_session_update(EditSessionModel model, EditSessionAction action)
{
    std::visit(
        [&](auto&& act) {
            using T = std::decay_t<decltype(act)>;

            if constexpr (std::is_same_v<T, actions::Open>) {
                model.is_open = true;
                model.close_requested = false;
                model.last_error.clear();
                reseed_from_selection(model);
            } else if constexpr (std::is_same_v<T, actions::Close>) {
                model.is_open = false;
                model.is_editing = false;
                model.close_requested = false;
            } else if constexpr (std::is_same_v<T, actions::SelectNode>) {
                model.selected = std::move(act.node);
                model.last_error.clear();
                reseed_from_selection(model);
            } else if constexpr (std::is_same_v<T, actions::BeginEdit>) {
                model.is_editing = true;
            } else if constexpr (std::is_same_v<T, actions::ChangeText>) {
                if (model.is_editing) {
                    model.edited_text = std::move(act.text);
                }
            } else if constexpr (std::is_same_v<T, actions::CancelEdit>) {
                model.last_error.clear();
                reseed_from_selection(model);
            } else if constexpr (std::is_same_v<T, actions::SaveSucceeded>) {
                model.is_editing = false;
                model.close_requested = true;
                model.last_error.clear();
            } else if constexpr (std::is_same_v<T, actions::SaveFailed>) {
                model.last_error = std::move(act.message);
            }
        },
        std::move(action));
    return model;
}

// Store type deduction helper
inline auto make_session_store_impl(EditSessionModel initial) {
    return lager::make_store<EditSessionAction>(std::move(initial), lager::with_manual_event_loop{},
                                                lager::with_reducer(edit_session_update));
}

using SessionStoreType = decltype(make_session_store_impl(std::declval<EditSessionModel>()));

// ============================================================
// EditSession Implementation
// ============================================================

struct EditSession::Impl {
    EditSessionCollaborators collaborators;
    std::unique_ptr<SessionStoreType> store;

    explicit Impl(EditSessionCollaborators c)
        : collaborators(std::move(c))
        , store(std::make_unique<SessionStoreType>(make_session_store_impl(EditSessionModel{})))
    {}

    [[nodiscard]] bool has_save_collaborators() const {
        return collaborators.get_document_text && collaborators.set_document_text &&
               collaborators.set_contents && collaborators.notify;
    }

    void report_failure(const std::string& message) {
        if (collaborators.notify) {
            collaborators.notify(Notification{NotificationKind::Error, message});
        }
        store->dispatch(actions::SaveFailed{message});
    }
};

EditSession::EditSession(EditSessionCollaborators collaborators)
    : impl_(std::make_unique<Impl>(std::move(collaborators)))
{}

EditSession::~EditSession() = default;

void EditSession::dispatch(EditSessionAction action) {
    impl_->store->dispatch(std::move(action));
}

const EditSessionModel& EditSession::get_model() const {
    return impl_->store->get();
}

void EditSession::open() {
    dispatch(actions::Open{});
}

void EditSession::close() {
    dispatch(actions::Close{});
}

void EditSession::select_node(SelectedNode node) {
    dispatch(actions::SelectNode{std::move(node)});
}

bool EditSession::select_path(Path path) {
    if (!impl_->collaborators.get_document_text) {
        detail::log_access_error("EditSession::select_path", "get_document_text is not set");
        return false;
    }

    std::string error;
    auto document = from_json(impl_->collaborators.get_document_text(), &error);
    if (!document) {
        detail::log_access_error("EditSession::select_path", "document is not valid JSON: " + error);
        return false;
    }

    const Value* node = find_at_path(*document, path);
    if (node == nullptr) {
        detail::log_access_error("EditSession::select_path", "no node at " + path_to_string(path));
        return false;
    }

    select_node(SelectedNode{node_rows_from_value(*node), std::move(path)});
    return true;
}

void EditSession::begin_edit() {
    dispatch(actions::BeginEdit{});
}

void EditSession::change_text(std::string text) {
    dispatch(actions::ChangeText{std::move(text)});
}

void EditSession::cancel_edit() {
    dispatch(actions::CancelEdit{});
}

bool EditSession::save() {
    if (!impl_->has_save_collaborators()) {
        detail::log_access_error("EditSession::save", "collaborators are not set");
        impl_->report_failure("Document store is not available");
        return false;
    }

    const auto& model = get_model();
    if (!model.selected) {
        impl_->report_failure(kNoNodeSelectedMessage);
        return false;
    }

    // Copy what the merge needs; dispatch below replaces the model
    const Path path = model.selected->path;
    const Value edited_fields = parse_edited_fields(model.edited_text);

    try {
        const std::string document = impl_->collaborators.get_document_text();
        auto result = update_json_by_path_checked(document, path, edited_fields);
        if (!result.updated()) {
            detail::log_access_error("EditSession::save", "document left unchanged: " + result.error);
        }

        std::string error;
        if (!from_json(result.text, &error)) {
            detail::log_access_error("EditSession::save", "updated document is not valid JSON: " + error);
            impl_->report_failure(kInvalidJsonMessage);
            return false;
        }

        impl_->collaborators.set_document_text(result.text);
        impl_->collaborators.set_contents(FileContents{result.text, true, false});
        impl_->collaborators.notify(Notification{NotificationKind::Success, kSaveSucceededMessage});
    } catch (const std::exception& e) {
        detail::log_access_error("EditSession::save", std::string("save aborted: ") + e.what());
        impl_->report_failure(kInvalidJsonMessage);
        return false;
    }

    dispatch(actions::SaveSucceeded{});
    return true;
}

void EditSession::watch(WatchCallback callback) {
    lager::watch(*impl_->store, std::move(callback));
}

} // namespace json_edit
