
#pragma once

#include <cstddef>
#include <type_traits>

/**
 * @defgroup smart-pointers Smart Pointers
 * @ingroup conduit-utils
 */

namespace conduit
{
/**
 * @ingroup smart-pointers
 * @brief A pointer that is observed, but never owned or deleted.
 *
 * A `Context` observes its `Processor` this way, and a `LoopbackTransport` its `Service`. The
 * observed object must outlive the observer.
 *
 * @see https://en.cppreference.com/w/cpp/experimental/observer_ptr
 */
template<class W> class observer_ptr
{
 private:
   W* ptr_{nullptr};

 public:
   using element_type = W;
   using pointer      = W*;
   using reference    = typename std::add_lvalue_reference<W>::type;

   constexpr observer_ptr() = default;
   constexpr observer_ptr(std::nullptr_t) {}
   constexpr explicit observer_ptr(pointer ptr)
       : ptr_{ptr}
   {}

   constexpr void reset(pointer p = nullptr) { ptr_ = p; }
   constexpr pointer get() const { return ptr_; }
   constexpr reference operator*() const { return *ptr_; }
   constexpr pointer operator->() const { return ptr_; }
   constexpr explicit operator bool() const { return ptr_ != nullptr; }

   friend constexpr bool operator==(const observer_ptr& a, const observer_ptr& b)
   {
      return a.get() == b.get();
   }
};

} // namespace conduit
