#ifndef MAKE_UNIQUE_NOTHROW_HPP
#define MAKE_UNIQUE_NOTHROW_HPP

#include <memory>
#include <new>
#include <utility>

// Like std::make_unique, but an allocation failure yields an empty pointer
// instead of throwing. Callers check the result and report a Result.
template<typename T, typename... Args>
std::unique_ptr<T> make_unique_nothrow(Args&&... args) {
  return std::unique_ptr<T>(new (std::nothrow) T(std::forward<Args>(args)...));
}

#endif // MAKE_UNIQUE_NOTHROW_HPP
