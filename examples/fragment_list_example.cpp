#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <syncmap.hpp>

using namespace syncmap;

// Helper function to print every fragment of a list
void printList(const TextFragmentList& list, const std::string& label) {
    std::cout << label << ":\n";
    for (size_t i = 0; i < list.size(); ++i) {
        const auto& f = list[i];
        std::cout << "  [" << i << "] " << f.begin().to_string() << " - " << f.end().to_string()
                  << "  (" << fragment_type_string(f.fragment_type()) << ") \"" << f.payload()
                  << "\"\n";
    }
    std::cout << std::endl;
}

TimeValue seconds(const char* text) {
    return TimeValue::parse(text).value();
}

int main() {
    // SPDLOG_LEVEL=syncmap=debug shows why operations were refused
    spdlog::cfg::load_env_levels();

    std::cout << "syncmap Fragment List Examples\n";
    std::cout << "==============================\n\n";

    // Example 1: Building a list
    std::cout << "1. Building a List\n";
    std::cout << "------------------\n";

    TextFragmentList list(seconds("0"), seconds("10"));
    auto add = [&list](const char* begin, const char* end, std::string text,
                       FragmentType type = FragmentType::regular) {
        auto result =
            list.add(TextFragment(TimeInterval(seconds(begin), seconds(end)), std::move(text), type));
        if (!result) {
            std::cout << "  add [" << begin << ", " << end
                      << "] refused: " << fragment_list_error_string(result.error()) << "\n";
        }
    };

    add("3", "3", "Sing, O goddess");
    add("0", "3", "", FragmentType::head);
    add("3", "6", "the anger of Achilles");
    add("6", "6", "son of Peleus");
    add("6", "10", "", FragmentType::tail);
    printList(list, "Sorted on insertion");

    // Example 2: Overlaps are refused
    std::cout << "2. Overlap Detection\n";
    std::cout << "--------------------\n";

    add("2", "4", "overlapping");
    add("8", "12", "outside the list");
    std::cout << std::endl;

    // Example 3: Repairing zero-length fragments
    std::cout << "3. Zero-Length Repair\n";
    std::cout << "---------------------\n";

    auto report = list.fix_zero_length_intervals(seconds("0.5"));
    std::cout << "  fixed " << report.fixed << ", unfixable " << report.unfixable << "\n";
    printList(list, "After repair");

    // Example 4: Moving a shared boundary
    std::cout << "4. Moving a Boundary\n";
    std::cout << "--------------------\n";

    bool moved = list.move_end(2, seconds("5"));
    std::cout << "  move_end(2, 5.000): " << (moved ? "moved" : "refused") << "\n";
    moved = list.move_end(2, seconds("9"));
    std::cout << "  move_end(2, 9.000): " << (moved ? "moved" : "refused") << "\n";
    printList(list, "After moving");

    // Example 5: Shifting the whole timeline
    std::cout << "5. Offset\n";
    std::cout << "---------\n";

    list.offset(seconds("1.5"));
    printList(list, "Shifted by 1.5 s (clamped at 10.000)");

    auto regular = list.indices_of(FragmentType::regular);
    std::cout << "Regular fragments: " << regular.size() << "\n";
    std::cout << "Zero-length fragments left: "
              << (list.has_zero_length_fragments() ? "yes" : "no") << "\n";

    return 0;
}
