#include <iostream>
#include <fstream>

#include "stanza/stanza.hpp"

int main(int argc, char** argv) {

    const char* text = R"({
        "name": "Zetta",
        "age": 27,
        "tags": ["c++", "json"],
        "items": [
            {"name": "Sword", "magical": true},
            {"name": "Shield", "magical": "rather not"}
        ]
    })";

    auto doc = Stanza::parse(text);
    if (!doc) {
        std::cerr << "Parse error! -> " << doc.error().describe() << "\n";
        return 1;
    }

    std::cout << "name: " << Stanza::get_string(*doc, "name").value_or("?") << "\n";
    std::cout << "tags: " << Stanza::get_count(*doc, "tags").value_or(0) << "\n";
    for (const auto& path : Stanza::find_paths_like(*doc, "items[%]", ".magical", "true"))
        std::cout << "magical: " << Stanza::get_string(*doc, { "%s.name", { path } }).value_or("?") << "\n";

    Stanza::Generator gen;
    gen.initialize_large_text_output({ .indent = 4 });
    gen.open_object();
    gen.write("name", "Zetta");
    gen.write("age", 27);
    gen.write("tags", *doc, "tags");
    gen.close_object();
    std::cout << gen.output();

    auto xml = Stanza::to_xml(text);
    if (xml) std::cout << *xml << "\n";

    if (argc > 1) {
        std::ifstream ifs(argv[1]);
        if (!ifs) {
            std::cerr << "Failed to open file\n";
            return -1;
        }

        std::vector<std::string> lines;
        for (std::string line; std::getline(ifs, line);) lines.push_back(line);

        auto file_r = Stanza::parse(lines);
        if (!file_r) {
            std::cerr << "Parse error! -> " << file_r.error().describe() << "\n";
            return 1;
        }

        if (Stanza::exists(*file_r, ".")) {
            Stanza::Generator out;
            out.initialize_output(std::cout, { .emit_header = false, .indent = 2 });
            out.write(*file_r);
        }
    }

    return 0;
}
