#include <iostream>
#include <string>
#include <vector>

import tierlink.api;

using namespace tierlink;

int main() {
    const std::vector<std::string> items = {"Family", "Health", "Family", "Work", "Growth", "Work"};
    const auto canonical = category::canonical_category_order(items);

    const std::vector<std::string> order = {"Work", "Family", "Growth", "Health"};
    auto frag = category::encode_category_order(order, canonical);
    if (!frag) {
        std::cerr << frag.error().to_string() << "\n";
        return 1;
    }
    std::cout << "category fragment: " << *frag << "\n";

    auto names = category::decode_category_order(*frag, canonical);
    if (!names) {
        std::cerr << names.error().to_string() << "\n";
        return 1;
    }
    for (const auto& n : *names) std::cout << n << "\n";
    return 0;
}
