//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/corosio
//

#ifndef BOOST_COROTLS_TEST_UNIT_TEST_SUITE_HPP
#define BOOST_COROTLS_TEST_UNIT_TEST_SUITE_HPP

#include <boost/core/lightweight_test.hpp>

#include <string_view>

#define BOOST_TEST_PASS() BOOST_TEST(true)
#define BOOST_TEST_FAIL() BOOST_TEST(false)

namespace test_suite {

// A registered suite, linked into a global list
struct any_suite
{
    any_suite const* next;

    any_suite();
    virtual ~any_suite() = default;

    virtual std::string_view name() const noexcept = 0;
    virtual void run() const = 0;
};

template<class T>
struct suite : any_suite
{
    std::string_view name_;

    explicit
    suite(std::string_view name) noexcept
        : name_(name)
    {
    }

    std::string_view
    name() const noexcept override
    {
        return name_;
    }

    void
    run() const override
    {
        T t;
        t.run();
    }
};

} // namespace test_suite

#define TEST_SUITE_CAT2(a, b) a##b
#define TEST_SUITE_CAT(a, b) TEST_SUITE_CAT2(a, b)

/** Register a suite type, whose `run()` is invoked by the driver.

    @param type A default-constructible type with `void run()`.
    @param name The dotted name used to select the suite.
*/
#define TEST_SUITE(type, name) \
    static ::test_suite::suite<type> const \
        TEST_SUITE_CAT(type, _registration)(name)

#endif
