// memory_test.cpp
// Paranoid API/contract tests for memview::memory and memview::read_only_memory.

#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QProcess>
#include <QProcessEnvironment>

#include <atomic>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>

#if !defined(MEMVIEW_ASSERT) && !defined(NDEBUG)
#  define MEMVIEW_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "memory_test.h"
#include "memory.hpp"

// ------------------------------------------------------------------------------------------
// Global allocation probe (read-only conversion must not allocate).
// ------------------------------------------------------------------------------------------
namespace memview_memory_alloc_probe {

static std::atomic<bool>        g_counting{false};
static std::atomic<std::size_t> g_news{0u};

struct scope {
    scope() {
        g_news.store(0u, std::memory_order_relaxed);
        g_counting.store(true, std::memory_order_relaxed);
    }
    ~scope() { g_counting.store(false, std::memory_order_relaxed); }

    [[nodiscard]] std::size_t count() const noexcept { return g_news.load(std::memory_order_relaxed); }
};

} // namespace memview_memory_alloc_probe

void* operator new(std::size_t n)
{
    if (memview_memory_alloc_probe::g_counting.load(std::memory_order_relaxed)) {
        memview_memory_alloc_probe::g_news.fetch_add(1u, std::memory_order_relaxed);
    }
    if (n == 0u) {
        n = 1u;
    }
    if (void* p = std::malloc(n)) {
        return p;
    }
    throw std::bad_alloc{};
}

void operator delete(void* p) noexcept
{
    std::free(p);
}

void operator delete(void* p, std::size_t) noexcept
{
    std::free(p);
}

// ------------------------------------------------------------------------------------------
// Death cases: views that no legal construction can produce.
// ------------------------------------------------------------------------------------------
namespace memview_memory_death_detail {

static constexpr int kDeathExitCode = 0xB3;

static void sigabrt_handler_(int) noexcept {
    std::_Exit(kDeathExitCode);
}

[[noreturn]] static void run_case_(const char* mode) {
    std::signal(SIGABRT, &sigabrt_handler_);

    using memview::detail::memory_rep;
    using memview::detail::owner_kind;

    memview::managed_array<int> arr{1, 2, 3, 4};
    memview::text_buffer text("abcd");
    memview::utf8_buffer utf8(u8"abcd");

    if (std::strcmp(mode, "span_unknown_kind") == 0) {
        const memory_rep r{ &arr, 0, 4, static_cast<owner_kind>(0x7Fu), false };
        const memview::memory<int> m(memview::unsafe, r);
        (void)m.span();
    } else if (std::strcmp(mode, "pin_unknown_kind") == 0) {
        const memory_rep r{ &arr, 0, 4, static_cast<owner_kind>(0x7Fu), false };
        const memview::memory<int> m(memview::unsafe, r);
        (void)m.pin();
    } else if (std::strcmp(mode, "span_empty_kind_with_owner") == 0) {
        const memory_rep r{ &arr, 0, 4, owner_kind::empty, false };
        const memview::read_only_memory<int> m(memview::unsafe, r);
        (void)m.span();
    } else if (std::strcmp(mode, "span_text_behind_int_view") == 0) {
        const memory_rep r{ &text, 0, 1, owner_kind::text, false };
        const memview::memory<int> m(memview::unsafe, r);
        (void)m.span();
    } else if (std::strcmp(mode, "pin_text_behind_int_view") == 0) {
        const memory_rep r{ &text, 0, 1, owner_kind::text, false };
        const memview::memory<int> m(memview::unsafe, r);
        (void)m.pin();
    } else if (std::strcmp(mode, "span_utf8_behind_u16_view") == 0) {
        const memory_rep r{ &utf8, 0, 2, owner_kind::utf8, false };
        const memview::memory<std::uint16_t> m(memview::unsafe, r);
        (void)m.span();
    } else {
        std::_Exit(0xEF);
    }

    std::_Exit(0xF0);
}

struct Runner_ {
    Runner_() {
        const char* mode = std::getenv("MEMVIEW_MEMORY_DEATH");
        if (mode && *mode) {
            run_case_(mode);
        }
    }
};

static const Runner_ g_runner_{};

} // namespace memview_memory_death_detail

namespace {

using memview::argument;
using memview::errc;
using memview::managed_array;
using memview::memory;
using memview::read_only_memory;
using memview::text_buffer;
using memview::utf8_buffer;

constexpr i32 kI32Max = std::numeric_limits<i32>::max();

// Runs fn and reports the memview error it threw (code() == 0 if none).
struct caught_error {
    errc     code{};
    argument arg{argument::none};

    [[nodiscard]] bool is(const errc c) const noexcept { return code == c; }
    [[nodiscard]] bool is(const errc c, const argument a) const noexcept { return code == c && arg == a; }
};

template <class Fn>
static caught_error catch_error(Fn&& fn) {
    caught_error out{};
    try {
        std::forward<Fn>(fn)();
    } catch (const memview::memory_error& e) {
        out.code = e.code();
        out.arg  = e.arg();
    }
    return out;
}

static void api_smoke_compile() {
    using M  = memory<int>;
    using RO = read_only_memory<int>;

    static_assert(std::is_trivially_copyable_v<M>);
    static_assert(std::is_trivially_copyable_v<RO>);
    static_assert(std::is_nothrow_default_constructible_v<M>);

    static_assert(std::is_nothrow_convertible_v<M, RO>);
    static_assert(!std::is_convertible_v<RO, M>);
    static_assert(!std::is_constructible_v<M, RO>);

    static_assert(std::is_same_v<decltype(std::declval<M&>().span()), std::span<int>>);
    static_assert(std::is_same_v<decltype(std::declval<RO&>().span()), std::span<const int>>);
    static_assert(std::is_same_v<decltype(std::declval<M&>().length()), i32>);
    static_assert(std::is_same_v<decltype(std::declval<M&>().slice(0)), M>);
    static_assert(std::is_same_v<decltype(std::declval<RO&>().slice(0, 0)), RO>);
    static_assert(std::is_same_v<decltype(std::declval<M&>().pin()), memview::memory_handle>);
    static_assert(std::is_same_v<decltype(std::declval<M&>().try_copy_to(std::declval<M>())), bool>);
    static_assert(std::is_same_v<decltype(std::declval<M&>().to_array()), managed_array<int>>);
    static_assert(std::is_same_v<decltype(std::declval<RO&>().to_string()), std::string>);

    // Owner kinds legal per element type.
    static_assert(std::is_constructible_v<read_only_memory<char>, const text_buffer*>);
    static_assert(!std::is_constructible_v<read_only_memory<int>, const text_buffer*>);
    static_assert(!std::is_constructible_v<read_only_memory<char8_t>, const text_buffer*>);
    static_assert(!std::is_constructible_v<memory<char>, const text_buffer*>);
    static_assert(std::is_constructible_v<read_only_memory<char8_t>, const utf8_buffer*>);
    static_assert(std::is_constructible_v<read_only_memory<unsigned char>, const utf8_buffer*>);
    static_assert(std::is_constructible_v<read_only_memory<std::byte>, const utf8_buffer*>);
    static_assert(!std::is_constructible_v<read_only_memory<char>, const utf8_buffer*>);
    static_assert(!std::is_constructible_v<read_only_memory<std::uint16_t>, const utf8_buffer*>);
    static_assert(!std::is_constructible_v<memory<int>, const managed_array<int>*>);
    static_assert(std::is_constructible_v<read_only_memory<int>, const managed_array<int>*>);

    // Owners bind as lvalues only: a view must not outlive a temporary owner.
    static_assert(std::is_constructible_v<read_only_memory<int>, const managed_array<int>&>);
    static_assert(!std::is_constructible_v<read_only_memory<int>, managed_array<int>&&>);
    static_assert(!std::is_convertible_v<managed_array<int>&&, read_only_memory<int>>);
    static_assert(!std::is_constructible_v<memory<int>, managed_array<int>&&>);
    static_assert(std::is_constructible_v<read_only_memory<char>, const text_buffer&>);
    static_assert(!std::is_constructible_v<read_only_memory<char>, text_buffer&&>);
    static_assert(!std::is_convertible_v<text_buffer&&, read_only_memory<char>>);
    static_assert(std::is_constructible_v<read_only_memory<char8_t>, const utf8_buffer&>);
    static_assert(!std::is_constructible_v<read_only_memory<char8_t>, utf8_buffer&&>);

    static_assert(std::is_invocable_r_v<std::size_t, std::hash<M>, const M&>);
    static_assert(std::is_invocable_r_v<std::size_t, std::hash<RO>, const RO&>);
}

static void ctad_suite() {
    managed_array<int> arr(3);
    text_buffer        t("abc");
    utf8_buffer        u(u8"abc");

    memview::memory m(arr);
    memview::read_only_memory r(static_cast<const managed_array<int>&>(arr));
    memview::read_only_memory rt(t);
    memview::read_only_memory ru(u);

    static_assert(std::is_same_v<decltype(m), memory<int>>);
    static_assert(std::is_same_v<decltype(r), read_only_memory<int>>);
    static_assert(std::is_same_v<decltype(rt), read_only_memory<char>>);
    static_assert(std::is_same_v<decltype(ru), read_only_memory<char8_t>>);

    QCOMPARE(m.length(), 3);
    QCOMPARE(rt.length(), 3);
    QCOMPARE(ru.length(), 3);
}

static void array_construction_suite() {
    managed_array<int> arr{10, 20, 30, 40, 50};

    const memory<int> whole(arr);
    QCOMPARE(whole.length(), 5);
    QVERIFY(!whole.empty());
    QCOMPARE(whole.span().data(), arr.data());
    QCOMPARE(whole.span().size(), std::size_t{5u});

    const memory<int> tail(&arr, 2);
    QCOMPARE(tail.length(), 3);
    QCOMPARE(tail.span()[0], 30);
    QCOMPARE(tail.span().data(), arr.data() + 2);

    const memory<int> mid(&arr, 1, 3);
    QCOMPARE(mid.length(), 3);
    QCOMPARE(mid.span()[0], 20);
    QCOMPARE(mid.span()[2], 40);

    // start == length is an empty view at the end.
    const memory<int> at_end(&arr, 5);
    QVERIFY(at_end.empty());
    QCOMPARE(at_end.span().size(), std::size_t{0u});
    const memory<int> at_end_n(&arr, 5, 0);
    QVERIFY(at_end_n.empty());
    QVERIFY(at_end == at_end_n);

    QVERIFY(catch_error([&] { (void)memory<int>(&arr, 6); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, -1); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, 0, 6); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, 5, 1); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, -1, 2); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, 2, -1); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, 1, kI32Max); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)memory<int>(&arr, kI32Max, 1); }).is(errc::out_of_range));

    // Absent array.
    managed_array<int>* none = nullptr;
    QVERIFY(memory<int>(none) == memory<int>{});
    QVERIFY(memory<int>(none, 0) == memory<int>{});
    QVERIFY(memory<int>(none, 0, 0) == memory<int>{});
    QVERIFY(memory<int>(none).span().empty());
    QVERIFY(catch_error([&] { (void)memory<int>(none, 1); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)memory<int>(none, 0, 1); }).is(errc::out_of_range));

    // Owner viewed read-only through a const pointer.
    managed_array<int> decades{10, 20, 30, 40, 50};
    const managed_array<int>* c = &decades;
    const read_only_memory<int> ro(c, 4);
    QCOMPARE(ro.length(), 1);
    QCOMPARE(ro.span()[0], 50);
}

static void erased_array_suite() {
    managed_array<int> arr{1, 2, 3};
    memview::array_base* erased = &arr;

    const memory<int> same(erased);
    QCOMPARE(same.length(), 3);
    QCOMPARE(same.span()[1], 2);

    // Same storage, other signedness.
    const memory<unsigned> as_unsigned(erased, 1, 2);
    QCOMPARE(as_unsigned.length(), 2);
    as_unsigned.span()[1] = 0xFFFFFFFFu;
    QCOMPARE(arr[2], -1);

    QVERIFY(catch_error([&] { (void)memory<float>(erased); }).is(errc::type_mismatch, argument::array));
    QVERIFY(catch_error([&] { (void)memory<long long>(erased); }).is(errc::type_mismatch, argument::array));
    QVERIFY(catch_error([&] { (void)memory<short>(erased, 0, 1); }).is(errc::type_mismatch, argument::array));

    // Element type is checked before the window.
    QVERIFY(catch_error([&] { (void)memory<float>(erased, 99); }).is(errc::type_mismatch));

    // Pointer elements need an exact match.
    managed_array<int*> ptrs(2);
    memview::array_base* erased_ptrs = &ptrs;
    QCOMPARE(memory<int*>(erased_ptrs).length(), 2);
    QVERIFY(catch_error([&] { (void)memory<const int*>(erased_ptrs); }).is(errc::type_mismatch));
    QVERIFY(catch_error([&] { (void)memory<std::uintptr_t>(erased_ptrs); }).is(errc::type_mismatch));

    memview::array_base* none = nullptr;
    QVERIFY(memory<float>(none) == memory<float>{});
}

static void text_construction_suite() {
    text_buffer t("hello");

    const read_only_memory<char> r(t);
    QCOMPARE(r.length(), 5);
    QVERIFY(r.span().data() == t.c_str());
    QCOMPARE(r.span()[4], 'o');

    const read_only_memory<char> r1(&t, 1);
    QCOMPARE(r1.length(), 4);
    QCOMPARE(r1.span()[0], 'e');

    const read_only_memory<char> r2(&t, 1, 3);
    QCOMPARE(r2.length(), 3);

    QVERIFY(read_only_memory<char>(&t, 5).empty());
    QVERIFY(catch_error([&] { (void)read_only_memory<char>(&t, 6); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)read_only_memory<char>(&t, 2, 4); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)read_only_memory<char>(&t, -2, 1); }).is(errc::out_of_range));

    const text_buffer* none = nullptr;
    QVERIFY(read_only_memory<char>(none) == read_only_memory<char>{});
    QVERIFY(catch_error([&] { (void)read_only_memory<char>(none, 1); }).is(errc::out_of_range));

    text_buffer empty_text("");
    QVERIFY(read_only_memory<char>(empty_text).empty());
    QVERIFY(!(read_only_memory<char>(empty_text) == read_only_memory<char>{}));
}

static void utf8_construction_suite() {
    utf8_buffer u(u8"bytes");

    const read_only_memory<char8_t> r(u);
    QCOMPARE(r.length(), 5);
    QVERIFY(r.span()[0] == u8'b');

    const read_only_memory<unsigned char> ru(&u, 1, 2);
    QCOMPARE(ru.length(), 2);
    QCOMPARE(ru.span()[0], static_cast<unsigned char>('y'));

    const read_only_memory<std::byte> rb(&u, 4);
    QCOMPARE(rb.length(), 1);
    QVERIFY(rb.span()[0] == std::byte{'s'});

    QVERIFY(catch_error([&] { (void)read_only_memory<char8_t>(&u, 6); }).is(errc::out_of_range));
}

static void manager_construction_suite() {
    memview::native_memory_manager<int> mgr(8);
    {
        const std::span<int> s = mgr.get_span();
        for (std::size_t i = 0; i < s.size(); ++i) {
            s[i] = static_cast<int>(i) * 10;
        }
    }

    const memory<int> all = mgr.get_memory();
    QCOMPARE(all.length(), 8);
    QCOMPARE(all.span()[7], 70);

    const memory<int> part(&mgr, 2, 4);
    QCOMPARE(part.span()[0], 20);
    QCOMPARE(part.span().size(), std::size_t{4u});

    const read_only_memory<int> ro(&mgr, 3);
    QCOMPARE(ro.length(), 3);
    QCOMPARE(ro.span()[2], 20);

    // Upper bound is not known until access.
    const memory<int> too_long(&mgr, 2, 100);
    QCOMPARE(too_long.length(), 100);
    QVERIFY(catch_error([&] { (void)too_long.span(); }).is(errc::out_of_range));

    QVERIFY(catch_error([&] { (void)memory<int>(&mgr, -1); }).is(errc::out_of_range, argument::length));
    QVERIFY(catch_error([&] { (void)memory<int>(&mgr, -1, 2); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)memory<int>(&mgr, 1, kI32Max); }).is(errc::out_of_range, argument::length));

    memview::memory_manager<int>* none = nullptr;
    QVERIFY(memory<int>(none, 0) == memory<int>{});
    QVERIFY(catch_error([&] { (void)memory<int>(none, 3); }).is(errc::out_of_range, argument::manager));
}

static void slicing_suite() {
    managed_array<int> arr{10, 20, 30, 40, 50};
    const memory<int> m(arr);

    const memory<int> s = m.slice(1, 3);
    QCOMPARE(s.length(), 3);
    QCOMPARE(s.span()[0], 20);
    QCOMPARE(s.span()[1], 30);
    QCOMPARE(s.span()[2], 40);

    QVERIFY(m.slice(0) == m);
    QVERIFY(m.slice(0, 5) == m);
    QVERIFY(m.slice(5).empty());
    QVERIFY(m.slice(1).slice(1, 2) == m.slice(2, 2));
    QVERIFY(m.slice(1, 3).slice(2) == m.slice(3, 1));

    QVERIFY(catch_error([&] { (void)m.slice(6); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)m.slice(-1); }).is(errc::out_of_range, argument::start));
    QVERIFY(catch_error([&] { (void)m.slice(2, 4); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)m.slice(0, -1); }).is(errc::out_of_range));
    QVERIFY(catch_error([&] { (void)m.slice(1, 3).slice(1, 3); }).is(errc::out_of_range));

    // Slicing an empty view.
    const memory<int> empty{};
    QVERIFY(empty.slice(0) == empty);
    QVERIFY(empty.slice(0, 0) == empty);
    QVERIFY(catch_error([&] { (void)empty.slice(1); }).is(errc::out_of_range));

    // Read-only slicing mirrors the writable one.
    const read_only_memory<int> ro = m;
    QVERIFY(ro.slice(1, 3) == read_only_memory<int>(s));
}

static void manager_revalidation_suite() {
    memview::native_memory_manager<int> mgr(8);
    const memory<int> m(&mgr, 2, 4);

    QCOMPARE(m.span().size(), std::size_t{4u});

    // Manager now reports 4 elements: [2, 6) no longer fits.
    QVERIFY(mgr.resize(4));
    QCOMPARE(mgr.length(), 4);
    QVERIFY(catch_error([&] { (void)m.span(); }).is(errc::out_of_range));

    // Slicing does not look at the owner.
    const memory<int> head = m.slice(0, 2);
    QCOMPARE(head.span().size(), std::size_t{2u});
    QVERIFY(catch_error([&] { (void)m.slice(1).span(); }).is(errc::out_of_range));

    QVERIFY(mgr.resize(6));
    QCOMPARE(m.span().size(), std::size_t{4u});

    QVERIFY(!mgr.resize(9));
    QVERIFY(!mgr.resize(-1));
    QCOMPARE(mgr.length(), 6);
}

static void to_array_suite() {
    managed_array<int> arr{10, 20, 30, 40, 50};
    const memory<int> m(arr);

    auto copy = m.slice(1, 3).to_array();
    QCOMPARE(copy.length(), 3);
    QCOMPARE(copy[0], 20);
    QCOMPARE(copy[1], 30);
    QCOMPARE(copy[2], 40);
    QVERIFY(copy.data() != arr.data() + 1);

    copy[0] = 99;
    QCOMPARE(arr[1], 20);

    const auto empty_copy = memory<int>{}.to_array();
    QCOMPARE(empty_copy.length(), 0);

    text_buffer t("hello");
    const auto chars = read_only_memory<char>(t).slice(1, 3).to_array();
    QCOMPARE(chars.length(), 3);
    QCOMPARE(chars[0], 'e');
    QCOMPARE(chars[2], 'l');
}

static void rendering_suite() {
    text_buffer t("hello");
    const read_only_memory<char> r(t);
    QVERIFY(r.slice(1, 3).to_string() == "ell");
    QVERIFY(r.to_string() == "hello");
    QVERIFY(r.slice(5).to_string().empty());

    managed_array<char> chars{'a', 'b', 'c'};
    QVERIFY(memory<char>(chars).to_string() == "abc");
    QVERIFY(memory<char>(chars).slice(1).to_string() == "bc");

    utf8_buffer u(u8"bytes");
    QVERIFY(read_only_memory<char8_t>(u).slice(0, 4).to_string() == "byte");

    // Non-text element types render a diagnostic.
    managed_array<int> ints{1, 2, 3, 4, 5};
    const std::string diag = memory<int>(ints).to_string();
    QVERIFY2(diag.rfind("memview::memory<", 0) == 0, diag.c_str());
    QVERIFY2(diag.find("int") != std::string::npos, diag.c_str());
    QVERIFY2(diag.size() >= 3u && diag.compare(diag.size() - 3u, 3u, "[5]") == 0, diag.c_str());

    const std::string ro_diag = read_only_memory<int>(ints).slice(1, 2).to_string();
    QVERIFY2(ro_diag.rfind("memview::read_only_memory<", 0) == 0, ro_diag.c_str());
    QVERIFY2(ro_diag.compare(ro_diag.size() - 3u, 3u, "[2]") == 0, ro_diag.c_str());

    // Plain bytes are never rendered as text.
    const std::string bytes = read_only_memory<std::byte>(u).to_string();
    QVERIFY2(bytes.rfind("memview::read_only_memory<", 0) == 0, bytes.c_str());

    QVERIFY(memory<char>{}.to_string().empty());
    QVERIFY(memory<int>{}.to_string().find("[0]") != std::string::npos);
}

static void copy_suite() {
    managed_array<int> src_arr{1, 2, 3};
    const memory<int> src(src_arr);

    // Destination too short.
    {
        managed_array<int> dst_arr{7, 7};
        const memory<int> dst(dst_arr);
        QVERIFY(catch_error([&] { src.copy_to(dst); }).is(errc::destination_too_short, argument::destination));
        QVERIFY(!src.try_copy_to(dst));
        QCOMPARE(dst_arr[0], 7);
        QCOMPARE(dst_arr[1], 7);
    }
    // Exact fit.
    {
        managed_array<int> dst_arr(3);
        src.copy_to(memory<int>(dst_arr));
        QCOMPARE(dst_arr[0], 1);
        QCOMPARE(dst_arr[2], 3);
    }
    // Longer destination keeps its tail.
    {
        managed_array<int> dst_arr{9, 9, 9, 9};
        QVERIFY(src.try_copy_to(memory<int>(dst_arr)));
        QCOMPARE(dst_arr[2], 3);
        QCOMPARE(dst_arr[3], 9);
    }
    // Empty source.
    {
        managed_array<int> dst_arr{5};
        QVERIFY(memory<int>{}.try_copy_to(memory<int>(dst_arr)));
        QVERIFY(memory<int>{}.try_copy_to(memory<int>{}));
        QCOMPARE(dst_arr[0], 5);
    }
    // Overlap, forward.
    {
        managed_array<int> buf{1, 2, 3, 4, 5};
        const memory<int> m(buf);
        m.slice(0, 4).copy_to(m.slice(1));
        QCOMPARE(buf[0], 1);
        QCOMPARE(buf[1], 1);
        QCOMPARE(buf[2], 2);
        QCOMPARE(buf[3], 3);
        QCOMPARE(buf[4], 4);
    }
    // Overlap, backward.
    {
        managed_array<int> buf{1, 2, 3, 4, 5};
        const memory<int> m(buf);
        m.slice(1).copy_to(m.slice(0, 4));
        QCOMPARE(buf[0], 2);
        QCOMPARE(buf[1], 3);
        QCOMPARE(buf[2], 4);
        QCOMPARE(buf[3], 5);
        QCOMPARE(buf[4], 5);
    }
    // Overlap with a non-trivially-copyable element type.
    {
        managed_array<std::string> buf{"a", "b", "c", "d"};
        const memory<std::string> m(buf);
        m.slice(0, 3).copy_to(m.slice(1));
        QVERIFY(buf[0] == "a");
        QVERIFY(buf[1] == "a");
        QVERIFY(buf[2] == "b");
        QVERIFY(buf[3] == "c");

        managed_array<std::string> back{"a", "b", "c", "d"};
        const memory<std::string> mb(back);
        mb.slice(1).copy_to(mb.slice(0, 3));
        QVERIFY(back[0] == "b");
        QVERIFY(back[1] == "c");
        QVERIFY(back[2] == "d");
        QVERIFY(back[3] == "d");
    }
    // Read-only source into a writable view.
    {
        text_buffer t("hello");
        managed_array<char> out(5);
        QVERIFY(read_only_memory<char>(t).slice(1, 3).try_copy_to(memory<char>(out)));
        QCOMPARE(out[0], 'e');
        QCOMPARE(out[2], 'l');
        QCOMPARE(out[3], '\0');
    }
    // Destination re-validated against a shrunk manager.
    {
        memview::native_memory_manager<int> mgr(4);
        const memory<int> dst(&mgr, 0, 4);
        QVERIFY(mgr.resize(2));
        QVERIFY(catch_error([&] { (void)src.slice(0, 1).try_copy_to(dst); }).is(errc::out_of_range));
    }
}

static void equality_hash_suite() {
    managed_array<int> a{1, 2, 3, 4};
    managed_array<int> twin{1, 2, 3, 4};

    const memory<int> x(&a, 1, 2);
    const memory<int> y(&a, 1, 2);

    QVERIFY(x == x);
    QVERIFY(x == y);
    QVERIFY(y == x);
    QCOMPARE(x.hash_code(), y.hash_code());
    QCOMPARE(std::hash<memory<int>>{}(x), x.hash_code());

    QVERIFY(!(x == memory<int>(&a, 0, 2)));
    QVERIFY(!(x == memory<int>(&a, 1, 3)));
    QVERIFY(!(x == memory<int>(&twin, 1, 2)));   // identity, not contents
    QVERIFY(!(x == memory<int>{}));

    // Mixed writable / read-only comparison.
    const read_only_memory<int> rx = x;
    QVERIFY(rx == x);
    QVERIFY(x == rx);
    QCOMPARE(rx.hash_code(), x.hash_code());
    QCOMPARE(std::hash<read_only_memory<int>>{}(rx), x.hash_code());

    // Empty view hashes to 0.
    QCOMPARE(memory<int>{}.hash_code(), std::size_t{0u});
    QCOMPARE(read_only_memory<int>{}.hash_code(), std::size_t{0u});
    QVERIFY(memory<int>{} == memory<int>{});

    // Order-sensitive mix: swapping index and length changes the hash.
    const memory<int> ab(&a, 1, 2);
    const memory<int> ba(&a, 2, 1);
    QVERIFY(!(ab == ba));
    QVERIFY(ab.hash_code() != ba.hash_code());

    std::unordered_set<memory<int>> set;
    set.insert(x);
    set.insert(y);
    set.insert(memory<int>(&a, 1, 2));
    set.insert(memory<int>(&twin, 1, 2));
    QCOMPARE(set.size(), std::size_t{2u});
}

static void read_only_conversion_suite() {
    managed_array<int> arr{1, 2, 3};
    const memory<int> m(&arr, 1, 2);

    std::size_t news = 0u;
    read_only_memory<int> ro{};
    {
        memview_memory_alloc_probe::scope probe;
        ro = m;
        const read_only_memory<int> again = m.slice(1);
        (void)again;
        news = probe.count();
    }
    QCOMPARE(news, std::size_t{0u});

    QVERIFY(ro == m);
    QCOMPARE(ro.length(), 2);
    QVERIFY(ro.span().data() == m.span().data());

    // Round trip back to a writable view keeps the identity.
    const memory<int> back = memview::memory_marshal::as_memory(ro);
    QVERIFY(back == m);
    back.span()[0] = 42;
    QCOMPARE(arr[1], 42);
    QCOMPARE(ro.span()[0], 42);

    // Text views can only be opened for writing through the marshal.
    text_buffer t("abc");
    const read_only_memory<char> rt(t);
    const memory<char> wt = memview::memory_marshal::as_memory(rt);
    QCOMPARE(wt.length(), 3);
    QVERIFY(wt.to_string() == "abc");
    QVERIFY(static_cast<read_only_memory<char>>(wt) == rt);
}

static void marshal_suite() {
    using memview::memory_marshal;
    using memview::owner_slice;

    managed_array<int> arr{1, 2, 3, 4};
    const memory<int> m(&arr, 1, 2);

    owner_slice<const memview::array_base> as{};
    QVERIFY(memory_marshal::try_get_array(read_only_memory<int>(m), as));
    QCOMPARE(as.owner, static_cast<const memview::array_base*>(&arr));
    QCOMPARE(as.start, 1);
    QCOMPARE(as.length, 2);

    owner_slice<const text_buffer> ts{};
    QVERIFY(!memory_marshal::try_get_text(read_only_memory<int>(m), ts));
    QVERIFY(ts.owner == nullptr);

    text_buffer t("hello");
    QVERIFY(memory_marshal::try_get_text(read_only_memory<char>(&t, 2, 2), ts));
    QVERIFY(ts.owner == &t);
    QCOMPARE(ts.start, 2);
    QCOMPARE(ts.length, 2);
    QVERIFY(!memory_marshal::try_get_array(read_only_memory<char>(t), as));

    utf8_buffer u(u8"abc");
    owner_slice<const utf8_buffer> us{};
    QVERIFY(memory_marshal::try_get_utf8(read_only_memory<std::byte>(&u, 1), us));
    QVERIFY(us.owner == &u);
    QCOMPARE(us.start, 1);
    QCOMPARE(us.length, 2);

    memview::native_memory_manager<int> mgr(6);
    owner_slice<memview::memory_manager<int>> ms{};
    QVERIFY(memory_marshal::try_get_manager(read_only_memory<int>(&mgr, 1, 3), ms));
    QCOMPARE(ms.owner, static_cast<memview::memory_manager<int>*>(&mgr));
    QCOMPARE(ms.start, 1);
    QCOMPARE(ms.length, 3);
    QVERIFY(!memory_marshal::try_get_manager(read_only_memory<int>(m), ms));

    QVERIFY(!memory_marshal::try_get_array(read_only_memory<int>{}, as));

    // Raw round trip through the representation.
    const memview::detail::memory_rep rep = memory_marshal::get_rep(m);
    QCOMPARE(rep.index, 1);
    QCOMPARE(rep.length, 2);
    QVERIFY(rep.kind == memview::detail::owner_kind::array);
    QVERIFY(memory<int>(memview::unsafe, rep) == m);
}

} // namespace

class tst_memory_api_paranoid final : public QObject {
    Q_OBJECT

private slots:
    void api_smoke() {
        api_smoke_compile();
    }

    void ctad() {
        ctad_suite();
    }

    void array_construction() {
        array_construction_suite();
    }

    void erased_array() {
        erased_array_suite();
    }

    void text_construction() {
        text_construction_suite();
    }

    void utf8_construction() {
        utf8_construction_suite();
    }

    void manager_construction() {
        manager_construction_suite();
    }

    void slicing() {
        slicing_suite();
    }

    void manager_revalidation() {
        manager_revalidation_suite();
    }

    void to_array() {
        to_array_suite();
    }

    void rendering() {
        rendering_suite();
    }

    void copying() {
        copy_suite();
    }

    void equality_and_hash() {
        equality_hash_suite();
    }

    void read_only_conversion() {
        read_only_conversion_suite();
    }

    void marshal() {
        marshal_suite();
    }

    void death_tests() {
        auto expect_death = [&](const char* mode) {
            QProcess p;
            p.setProgram(QCoreApplication::applicationFilePath());
            p.setArguments(QStringList{});

            QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
            env.insert("MEMVIEW_MEMORY_DEATH", QString::fromLatin1(mode));
            p.setProcessEnvironment(env);

            p.start();
            QVERIFY2(p.waitForStarted(1500), "Death child failed to start.");

            if (!p.waitForFinished(8000)) {
                p.kill();
                QVERIFY2(false, "Death child did not finish (possible crash dialog).");
            }

            const int code = p.exitCode();
            QVERIFY2(code == memview_memory_death_detail::kDeathExitCode,
                     "Expected fail-fast death (SIGABRT -> kDeathExitCode).");
        };

        expect_death("span_unknown_kind");
        expect_death("pin_unknown_kind");
        expect_death("span_empty_kind_with_owner");
        expect_death("span_text_behind_int_view");
        expect_death("pin_text_behind_int_view");
        expect_death("span_utf8_behind_u16_view");
    }
};

int run_tst_memory_api_paranoid(int argc, char** argv) {
    tst_memory_api_paranoid tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "memory_test.moc"
