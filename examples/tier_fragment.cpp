#include <cstddef>
#include <iostream>
#include <string>

import tierlink.api;

using namespace tierlink;

int main() {
    constexpr std::size_t N = 10;

    TierState state;
    state.very     = {3, 1};
    state.somewhat = {7};
    state.not_     = {0};

    auto fragment = codec::encode_tier_state(state, N);
    if (!fragment) {
        std::cerr << fragment.error().to_string() << "\n";
        return 1;
    }
    std::cout << "fragment: " << *fragment << "\n";

    auto back = codec::decode_tier_state(*fragment, N);
    if (!back) {
        std::cerr << back.error().to_string() << "\n";
        return 1;
    }
    std::cout << "not:";
    for (Index i : back->not_) std::cout << ' ' << i;
    std::cout << "\n";

    // A stale link with a bumped version byte.
    auto bad = codec::decode_tier_state("#AgACAAE", N);
    if (!bad) std::cout << "rejected: " << bad.error().to_string() << "\n";
    return 0;
}
