#ifndef CAPGATE_MEM_ALLOCATOR_H
#define CAPGATE_MEM_ALLOCATOR_H

#include <cstddef>
#include <cstdlib>
#include <limits>
#include <new>
#include <oneapi/tbb/scalable_allocator.h>
#include <type_traits>
#include <utility>

namespace capgate
{
    /// Standard-conforming allocator over the TBB scalable heap.
    template <typename T>
    class mem_allocator
    {
    public:
        using value_type = T;
        using pointer = T *;
        using const_pointer = const T *;
        using size_type = size_t;
        using difference_type = ptrdiff_t;
        using propagate_on_container_move_assignment = std::true_type;
        using is_always_equal = std::true_type;

        mem_allocator() noexcept = default;

        template <typename U>
        mem_allocator(const mem_allocator<U> &) noexcept
        {
        }

        static pointer allocate(size_type num)
        {
            if (num > max_size()) throw std::bad_array_new_length();
            if (auto p = static_cast<pointer>(scalable_malloc(num * sizeof(T)))) return p;
            throw std::bad_alloc();
        }

        static void deallocate(pointer p, size_type = 0) noexcept { scalable_free(p); }

        static constexpr size_type max_size() noexcept { return std::numeric_limits<size_type>::max() / sizeof(T); }

        template <typename U>
        struct rebind
        {
            using other = mem_allocator<U>;
        };
    };

    template <typename T, typename U>
    bool operator==(const mem_allocator<T> &, const mem_allocator<U> &)
    {
        return true;
    }

    template <typename T, typename U>
    bool operator!=(const mem_allocator<T> &, const mem_allocator<U> &)
    {
        return false;
    }

    template <typename T, typename... Args>
    inline T *alloc(Args &&...args)
    {
        T *p = mem_allocator<T>::allocate(1);
        try
        {
            ::new ((void *)p) T(std::forward<Args>(args)...);
        }
        catch (...)
        {
            mem_allocator<T>::deallocate(p);
            throw;
        }
        return p;
    }

    template <typename T>
    inline void release(T *p) noexcept
    {
        if (!p) return;
        if constexpr (!std::is_trivially_destructible_v<T>) p->~T();
        mem_allocator<T>::deallocate(p);
    }
} // namespace capgate

#endif
