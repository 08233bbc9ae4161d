#pragma once

#include <utility>

namespace rendergate {

// Runs the given function when leaving the enclosing scope.
template<class F>
class Defer {
public:
    Defer(F on_destruct)
        : _on_destruct(std::move(on_destruct))
    {}

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&&) = default;

    ~Defer() {
        _on_destruct();
    }

private:
    F _on_destruct;
};

template<class F> Defer<F> defer(F f) {
    return Defer<F>(std::move(f));
}

} // namespace
