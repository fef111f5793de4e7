#include "builder.hpp"
#include "builder_options.hpp"

#include <iostream>
#include <string>

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <url> [output] [mode] [settings.json]\n"
              << "  modes: page, text, complete, archive (default), archive-temp, archive-keep, stdout"
              << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string url = argv[1];
    std::string output = "page.mht";
    std::string mode = "archive";
    BuilderOptions options;

    if (argc > 2) output = argv[2];
    if (argc > 3) mode = argv[3];
    if (argc > 4) options = BuilderOptions::load(argv[4]);

    try {
        Builder builder(options);
        std::string result;
        if (mode == "page") {
            result = builder.save_page(output, url);
        } else if (mode == "text") {
            result = builder.save_page_text(output, url);
        } else if (mode == "complete") {
            result = builder.save_page_complete(output, url);
        } else if (mode == "archive") {
            result = builder.save_page_archive(output, StorageMode::Memory, url);
        } else if (mode == "archive-temp") {
            result = builder.save_page_archive(output, StorageMode::DiskTemporary, url);
        } else if (mode == "archive-keep") {
            result = builder.save_page_archive(output, StorageMode::DiskPermanent, url);
        } else if (mode == "stdout") {
            std::cout << builder.get_page_archive(url);
            return 0;
        } else {
            std::cerr << "Error: unknown mode '" << mode << "'" << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        std::cout << result << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
