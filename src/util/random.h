#pragma once

#include <chrono>
#include <cstdint>
#include <iterator>
#include <string>

namespace rendergate { namespace util { namespace random {

void data(void*, unsigned int);

template<typename N /* e.g. uint64_t */>
inline N number()
{
    N ret;
    data(reinterpret_cast<char*>(&ret), sizeof(N));
    return ret;
}

// Uniformly distributed in [0, 1).
double unit();

// Uniformly distributed in [min, max).
std::chrono::milliseconds duration_between( std::chrono::milliseconds min
                                          , std::chrono::milliseconds max);

// Picks one element of a non-empty container.
template<class Container>
inline const typename Container::value_type& choice(const Container& c)
{
    auto i = number<uint64_t>() % c.size();
    auto it = c.begin();
    std::advance(it, i);
    return *it;
}

}}} // namespace
