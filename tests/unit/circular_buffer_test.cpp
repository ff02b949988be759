#include <cassert>
#include <string>
#include <vector>
#include "core/circular_buffer.hpp"

int main() {
    // Overwrite keeps the last n, oldest first
    core::CircularBuffer<int> cb(3);
    assert(cb.is_empty());
    assert(!cb.is_full());
    for (int i = 1; i <= 5; ++i) cb.append(i);
    assert(cb.is_full());
    assert(cb.size() == 3);
    std::vector<int> expected{3, 4, 5};
    assert(cb.elements() == expected);
    std::vector<int> newest_first{5, 4, 3};
    assert(cb.reversed() == newest_first);

    // Partially filled
    core::CircularBuffer<std::string> names(4);
    names.append("a");
    names.append("b");
    assert(names.size() == 2);
    assert(!names.is_full());
    assert(names.elements().front() == "a");
    assert(names.reversed().front() == "b");

    // Clear resets ordering
    cb.clear();
    assert(cb.is_empty());
    cb.append(42);
    assert(cb.elements() == std::vector<int>{42});

    // Default capacity and zero capacity
    core::CircularBuffer<int> defaulted;
    assert(defaulted.capacity() == 10);
    core::CircularBuffer<int> tiny(0);
    assert(tiny.capacity() == 1);
    tiny.append(1);
    tiny.append(2);
    assert(tiny.elements() == std::vector<int>{2});
    return 0;
}
