#include <capgate/arch/aarch64.hpp>
#include <capgate/arch/x86.hpp>
#include <capgate/enum.hpp>
#include <capgate/feature_set.hpp>
#include <cassert>
#include <cstring>

using namespace capgate;

struct FlagBits
{
    enum enum_type : u32
    {
        A = 1 << 0,
        B = 1 << 1,
        C = 1 << 2,
    };
    using flag_bitmask = std::true_type;
};

using Flags = flags<FlagBits>;

enum class color : u8
{
    red,
    green,
    blue,
    alpha
};

using color_set = enum_set<color, 4>;

void test_flags()
{
    Flags f0;
    assert(static_cast<Flags::mask_t>(f0) == 0);

    Flags f1(FlagBits::A);
    Flags f2(FlagBits::B);
    Flags combined = f1 | f2;
    assert(combined.has(FlagBits::A) && combined.has(FlagBits::B));
    assert(!combined.has(FlagBits::C));

    Flags masked = combined & f1;
    assert(masked == f1);

    Flags assign = f1;
    assign |= f2;
    assert(assign == combined);
    assign &= f1;
    assert(assign == f1);
    assign ^= f2;
    assert(static_cast<Flags::mask_t>(assign) == (FlagBits::A | FlagBits::B));

    auto all = arch::x86::all_flags();
    assert(all.has(arch::x86::flag_bits::use_count_leading_zeros_instruction));
    assert(all.has(arch::x86::flag_bits::use_count_trailing_zeros_instruction));
}

void test_enum_set()
{
    color_set empty;
    assert(empty.empty());
    assert(empty.size() == 0);
    assert(empty.begin() == empty.end());

    // Iteration follows ordinal order, not insertion order
    color_set set{color::blue, color::red};
    assert(set.size() == 2);
    auto it = set.begin();
    assert(*it == color::red);
    ++it;
    assert(*it == color::blue);
    ++it;
    assert(it == set.end());

    assert(set.add(color::green));
    assert(!set.add(color::green));
    assert(set.size() == 3);

    color_set subset{color::red, color::green};
    assert(set.contains_all(subset));
    assert(!subset.contains_all(set));
    assert(set.contains_all(color_set{}));

    color_set diff = set - subset;
    assert(diff == color_set{color::blue});

    set.remove(color::blue);
    assert(set == subset);

    assert(color_set::all().size() == 4);
    assert(color_set::from_mask(~u64{0}) == color_set::all());

    color_set widened = subset;
    widened |= color_set{color::alpha};
    assert(widened.contains(color::alpha) && widened.contains(color::red));
}

void test_feature_names()
{
    using x86 = arch::x86;
    static_assert(sizeof(x86::feature_names) / sizeof(x86::feature_names[0]) == x86::feature_count);
    static_assert(sizeof(arch::aarch64::feature_names) / sizeof(arch::aarch64::feature_names[0]) ==
                  arch::aarch64::feature_count);

    assert(std::strcmp(feature_name<x86>(x86::feature::cx8), "CX8") == 0);
    assert(std::strcmp(feature_name<x86>(x86::feature::amd_3dnow_prefetch), "AMD_3DNOW_PREFETCH") == 0);
    assert(std::strcmp(feature_name<x86>(x86::feature::fma), "FMA") == 0);

    assert(parse_feature<x86>("AVX2") == x86::feature::avx2);
    assert(parse_feature<x86>(" sse4_2 ") == x86::feature::sse4_2);
    assert(!parse_feature<x86>("AVX3"));

    auto list = parse_feature_list<x86>("SSE2, CX8,,avx");
    assert((list == feature_set<x86>{x86::feature::cx8, x86::feature::sse2, x86::feature::avx}));
    assert(to_string<x86>(list) == "[CX8, SSE2, AVX]");
    assert(to_string<x86>(feature_set<x86>{}) == "[]");

    bool threw = false;
    try
    {
        parse_feature_list<x86>("SSE,NOPE,AVX9");
    }
    catch (const runtime_error &e)
    {
        threw = true;
        assert(std::strstr(e.what(), "[NOPE, AVX9]") != nullptr);
    }
    assert(threw);
}
