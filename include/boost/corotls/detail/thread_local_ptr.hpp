//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_DETAIL_THREAD_LOCAL_PTR_HPP
#define BOOST_COROTLS_DETAIL_THREAD_LOCAL_PTR_HPP

#include <boost/corotls/detail/config.hpp>

namespace boost::corotls::detail {

/** A thread-local pointer.

    Each thread has its own pointer value, initially nullptr.
    The storage is static per type T, so every instance of
    `thread_local_ptr<T>` names the same slot. The user is
    responsible for the lifetime of the pointed-to objects.

    @tparam T The pointed-to type.
*/
template<class T>
class thread_local_ptr
{
    static thread_local T* ptr_;

public:
    thread_local_ptr() = default;

    thread_local_ptr(thread_local_ptr const&) = delete;
    thread_local_ptr& operator=(thread_local_ptr const&) = delete;

    T*
    get() const noexcept
    {
        return ptr_;
    }

    void
    set(T* p) noexcept
    {
        ptr_ = p;
    }
};

template<class T>
thread_local T* thread_local_ptr<T>::ptr_ = nullptr;

} // namespace boost::corotls::detail

#endif
