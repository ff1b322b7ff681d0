// main.cpp - Node edit session example
//
// Usage: json_edit_demo [document.json]
//
// Loads a JSON document (or a built-in sample), lets you select a node by
// path, edit its flat text and save it back into the document.

#include <json_edit/builders.h>
#include <json_edit/edit_session.h>
#include <json_edit/path_core.h>
#include <json_edit/serialization.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace json_edit;

// ============================================================
// Sample Document
// ============================================================

std::string create_sample_document()
{
    Value ada = MapBuilder()
        .set("id", 1)
        .set("name", "Ada")
        .set("address", Value::map({{"city", "London"}, {"zip", "N1"}}))
        .set("tags", Value::vector({"vip", "early"}))
        .finish();

    Value grace = MapBuilder()
        .set("id", 2)
        .set("name", "Grace")
        .set("active", true)
        .finish();

    return to_json(MapBuilder()
        .set("customer", VectorBuilder().push_back(ada).push_back(grace).finish())
        .set("total", 9.5)
        .finish());
}

// "customer/0/name" -> ["customer", 0, "name"]; numeric segments are indices
Path parse_segments(const std::string& text)
{
    Path path;
    std::istringstream in(text);
    std::string segment;
    while (std::getline(in, segment, '/')) {
        if (segment.empty()) {
            continue;
        }
        if (segment.find_first_not_of("0123456789") == std::string::npos) {
            path.push_back(static_cast<std::size_t>(std::stoull(segment)));
        } else {
            path.push_back(segment);
        }
    }
    return path;
}

// ============================================================
// Main Application
// ============================================================

int main(int argc, char** argv)
{
    std::string document = create_sample_document();
    if (argc > 1) {
        std::ifstream file(argv[1]);
        if (!file) {
            std::cerr << "Cannot open " << argv[1] << "\n";
            return 1;
        }
        std::ostringstream contents;
        contents << file.rdbuf();
        document = contents.str();
    }

    EditSession session{EditSessionCollaborators{
        [&] { return document; },
        [&](const std::string& text) { document = text; },
        [](const FileContents& contents) {
            std::cout << "(file contents updated, " << contents.contents.size() << " bytes)\n";
        },
        [](const Notification& n) {
            std::cout << (n.kind == NotificationKind::Success ? "[ok] " : "[error] ") << n.message << "\n";
        },
    }};

    session.watch([](const EditSessionModel& model) {
        if (model.close_requested) {
            std::cout << "(editor closed)\n";
        }
    });

    std::cout << "=== JSON Node Editor ===\n\n";

    while (true) {
        const auto& model = session.get_model();
        std::cout << "Node: " << model.path_text << (model.is_editing ? "  [editing]" : "") << "\n";
        std::cout << model.edited_text << "\n";

        std::cout << "\n=== Operations ===\n";
        std::cout << "1. Select node (e.g. customer/0)\n";
        std::cout << "2. Edit text\n";
        std::cout << "S. Save\n";
        std::cout << "C. Cancel edit\n";
        std::cout << "V. View document\n";
        std::cout << "\nQ. Quit\n";
        std::cout << "\nChoice: ";

        char choice;
        if (!(std::cin >> choice)) {
            return 0;
        }
        std::cin.ignore();

        switch (choice) {
        case '1': {
            std::cout << "Enter path: ";
            std::string text;
            std::getline(std::cin, text);
            if (!session.select_path(parse_segments(text))) {
                std::cout << "No node at " << text << "\n";
            } else {
                session.open();
            }
            break;
        }
        case '2': {
            session.begin_edit();
            std::cout << "Enter new text, end with an empty line:\n";
            std::string text;
            std::string line;
            while (std::getline(std::cin, line) && !line.empty()) {
                text += line + "\n";
            }
            session.change_text(text);
            break;
        }
        case 'S':
        case 's':
            if (session.save()) {
                session.close();
            }
            break;
        case 'C':
        case 'c':
            session.cancel_edit();
            break;
        case 'V':
        case 'v':
            std::cout << document << "\n";
            break;
        case 'Q':
        case 'q':
            std::cout << "Goodbye!\n";
            return 0;
        default:
            std::cout << "Invalid choice!\n";
        }

        std::cout << "\n";
    }
}
