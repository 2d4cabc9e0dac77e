/**
 * crosspath Demo
 * ==============
 * Converts a few paths both ways and shows what the checks reject.
 */

#include <crosspath/crosspath.hpp>
#include <iostream>

void print_separator() {
    std::cout << std::string(60, '-') << "\n";
}

void print_result(const char* label, const crosspath::Result<std::string>& r) {
    if (r.ok) {
        std::cout << label << r.value << "\n";
    } else {
        std::cout << label << "<" << crosspath::error_to_string(r.error) << ">\n";
    }
}

int main() {
    using namespace crosspath;

    const std::string windows_path = R"(C:\Users\John\Documents\file.txt)";
    const std::string unix_path = "/home/john/documents/file.txt";

    std::cout << "crosspath Demo\n";
    std::cout << "==============\n\n";

    auto cp1 = CrossPath::create(windows_path);
    if (!cp1.ok) {
        std::cerr << "Error: " << error_to_string(cp1.error) << "\n";
        return 1;
    }
    std::cout << "Original path: " << cp1.value.original() << "\n";
    print_result("To Unix:       ", cp1.value.to_unix());

    auto cp2 = CrossPath::create(unix_path);
    if (!cp2.ok) {
        std::cerr << "Error: " << error_to_string(cp2.error) << "\n";
        return 1;
    }
    std::cout << "Original path: " << cp2.value.original() << "\n";
    print_result("To Windows:    ", cp2.value.to_windows());
    print_separator();

    // Custom mapping
    PathConfig config = default_path_config();
    config.drive_mappings = {{"C:", "/mnt/c"}, {"D:", "/mnt/data"}};
    auto cp3 = CrossPath::with_config(R"(D:\Projects\app\main.cpp)", config);
    if (cp3.ok) {
        print_result("Custom mapping: ", cp3.value.to_unix());
    }

    print_result("Direct:         ", to_unix_path(windows_path));
    print_separator();

    // Rejected input
    for (const char* bad : {"../../etc/passwd", R"(C:\temp\CON.txt)", "/etc/shadow", "report<1>.txt"}) {
        auto r = CrossPath::create(bad);
        std::cout << bad << " -> "
                  << (r.ok ? std::string("accepted") : error_to_string(r.error)) << "\n";
    }

    std::cout << "\nSanitized: " << PathSecurityChecker::sanitize_path("report<1>.txt") << "\n";
    return 0;
}
