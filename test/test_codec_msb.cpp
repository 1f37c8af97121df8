// test/test_codec_msb.cpp
/**
 * Unit Test: MSB Record Codec
 *
 * Tests serialize/deserialize of described records in MSB-first order.
 *
 * Test Coverage:
 *   1. Flat records with explicit and inferred widths
 *   2. Nested records and ignored members
 *   3. Runtime-length lists and the fields after them
 *   4. Fixed counts and std::array lists
 *   5. Polymorphic slots
 *   6. Value converters
 *   7. Signed members
 *   8. Non-zero bit offsets
 *   9. Related field policy
 *  10. Call-time errors
 */

#include "test_records.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

using namespace testrec;
using codec::ErrorKind;
using codec::MsbSerializer;

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

static std::string hex_bytes(const std::vector<uint8_t>& bytes) {
    std::string out;
    char buf[4];
    for (uint8_t b : bytes) {
        std::snprintf(buf, sizeof(buf), "%02X ", b);
        out += buf;
    }
    return out.empty() ? "(empty)" : out.substr(0, out.size() - 1);
}

static void expect_bytes(TestResult& result, const std::string& label,
                         const std::vector<uint8_t>& actual, std::initializer_list<uint8_t> expected) {
    const std::vector<uint8_t> want(expected);
    if (actual == want) {
        result.pass(label + " -> " + hex_bytes(actual));
    } else {
        result.fail(label + ": got " + hex_bytes(actual) + ", want " + hex_bytes(want));
    }
}

template <typename Fn>
static void expect_error(TestResult& result, const std::string& label, ErrorKind kind, Fn fn,
                         const std::string& fragment = "") {
    try {
        fn();
        result.fail(label + ": no exception");
    } catch (const codec::CodecError& e) {
        const std::string msg = e.what();
        if (e.kind() != kind) {
            result.fail(label + ": wrong kind " + codec::to_string(e.kind()) + " (" + msg + ")");
        } else if (!fragment.empty() && msg.find(fragment) == std::string::npos) {
            result.fail(label + ": message lacks '" + fragment + "': " + msg);
        } else {
            result.pass(label + " -> " + codec::to_string(kind));
        }
    }
}

// ============================================================================
// Records used only here
// ============================================================================

struct WideByteData {
    uint8_t value = 0;

    static void describe(codec::RecordSchema<WideByteData>& s) {
        s.name("WideByteData");
        s.field("value", &WideByteData::value).bits(9);
    }
};

// 32-bit count driving a list of 32-bit words
struct WordListData {
    uint32_t count = 0;
    std::vector<uint32_t> words;

    static void describe(codec::RecordSchema<WordListData>& s) {
        s.name("WordListData");
        s.field("count", &WordListData::count);
        s.field("words", &WordListData::words).related("count");
    }
};

struct RejectZeroConverter {
    static uint8_t to_raw(uint8_t logical) {
        if (logical == 0) {
            throw std::domain_error("zero has no raw form");
        }
        return logical;
    }
    static uint8_t to_logical(uint8_t raw) { return raw; }
};

struct RejectZeroData {
    uint8_t value = 0;

    static void describe(codec::RecordSchema<RejectZeroData>& s) {
        s.name("RejectZeroData");
        s.field("value", &RejectZeroData::value).converter<RejectZeroConverter>();
    }
};

// Test 1: Flat records
void test_flat_records(TestResult& result) {
    std::cout << "\n=== Test 1: Flat Records ===\n";

    SimpleData simple;
    simple.header = 0xAB;
    simple.value = 0x1234;
    simple.footer = 0xCD;
    expect_bytes(result, "SimpleData {AB,1234,CD}", MsbSerializer::serialize(simple), {0xAB, 0x12, 0x34, 0xCD});

    auto back = MsbSerializer::deserialize<SimpleData>(std::vector<uint8_t>{0xAB, 0x12, 0x34, 0xCD});
    if (back.header == 0xAB && back.value == 0x1234 && back.footer == 0xCD) {
        result.pass("SimpleData decodes AB 12 34 CD");
    } else {
        result.fail("SimpleData decode wrong");
    }

    SimpleData2 packed;
    packed.header = 0xA;
    packed.value = 0x58;
    packed.footer = 0x12;
    expect_bytes(result, "SimpleData2 4/7/5 bits", MsbSerializer::serialize(packed), {0xAB, 0x12});

    auto unpacked = MsbSerializer::deserialize<SimpleData2>(std::vector<uint8_t>{0xAB, 0x12});
    if (unpacked.header == 0xA && unpacked.value == 0x58 && unpacked.footer == 0x12) {
        result.pass("SimpleData2 decodes {AB,12} as A, 58, 12");
    } else {
        result.fail("SimpleData2 decode wrong");
    }

    EnumData enums;
    enums.status = TestStatus::Error;
    enums.code = 0xABCD;
    expect_bytes(result, "EnumData {Error,ABCD}", MsbSerializer::serialize(enums), {0x03, 0xAB, 0xCD});

    auto enum_back = MsbSerializer::deserialize<EnumData>(std::vector<uint8_t>{0x01, 0x00, 0x2A});
    if (enum_back.status == TestStatus::Active && enum_back.code == 42) {
        result.pass("EnumData decodes Active, 42");
    } else {
        result.fail("EnumData decode wrong");
    }

    CustomBitLengthData custom;
    custom.nibble_high = 0xA;
    custom.nibble_low = 0x5;
    custom.twelve_bits = 0x678;
    custom.four_bits = 0;
    expect_bytes(result, "CustomBitLengthData 4/4/12/4", MsbSerializer::serialize(custom), {0xA5, 0x67, 0x80});

    AutoBitLengthData inferred;
    inferred.byte_value = 0x12;
    inferred.ushort_value = 0x3456;
    inferred.int_value = 0x789ABCDE;
    expect_bytes(result, "AutoBitLengthData 8/16/32", MsbSerializer::serialize(inferred),
                 {0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE});
}

// Test 2: Nested records and ignored members
void test_nested_records(TestResult& result) {
    std::cout << "\n=== Test 2: Nested Records ===\n";

    NestedData nested;
    nested.header = 0xAA;
    nested.inner.x = 0x11;
    nested.inner.y = 0x22;
    nested.footer = 0xBB;
    expect_bytes(result, "NestedData", MsbSerializer::serialize(nested), {0xAA, 0x11, 0x22, 0xBB});

    auto back = MsbSerializer::deserialize<NestedData>(std::vector<uint8_t>{0xAA, 0x11, 0x22, 0xBB});
    if (back.header == 0xAA && back.inner.x == 0x11 && back.inner.y == 0x22 && back.footer == 0xBB) {
        result.pass("NestedData decodes inner record in place");
    } else {
        result.fail("NestedData decode wrong");
    }

    DataWithIgnored ignored;
    ignored.value = 0x11;
    ignored.description = "not encoded";
    ignored.another_value = 0x22;
    expect_bytes(result, "DataWithIgnored skips description", MsbSerializer::serialize(ignored), {0x11, 0x22});

    auto ignored_back = MsbSerializer::deserialize<DataWithIgnored>(std::vector<uint8_t>{0x11, 0x22});
    if (ignored_back.description.empty() && ignored_back.another_value == 0x22) {
        result.pass("Ignored member keeps its default on decode");
    } else {
        result.fail("Ignored member was touched");
    }
}

// Test 3: Runtime-length lists
void test_dynamic_lists(TestResult& result) {
    std::cout << "\n=== Test 3: Runtime-Length Lists ===\n";

    ListData list;
    list.count = 3;
    list.items = {0x11, 0x22, 0x33};
    expect_bytes(result, "ListData with 3 items", MsbSerializer::serialize(list), {0x30, 0x11, 0x22, 0x33});

    ListData empty;
    empty.reserved = 0xF;
    expect_bytes(result, "Empty ListData", MsbSerializer::serialize(empty), {0x0F});

    auto list_back = MsbSerializer::deserialize<ListData>(std::vector<uint8_t>{0x20, 0xAA, 0xBB, 0xCC});
    if (list_back.count == 2 && list_back.items == std::vector<uint8_t>{0xAA, 0xBB}) {
        result.pass("ListData decodes count 2 and ignores trailing bytes");
    } else {
        result.fail("ListData decode wrong");
    }

    ListNestedData nested;
    nested.count = 2;
    nested.items.resize(2);
    nested.items[0].x = 0x11;
    nested.items[0].y = 0x22;
    nested.items[1].x = 0x33;
    nested.items[1].y = 0x44;
    expect_bytes(result, "ListNestedData", MsbSerializer::serialize(nested), {0x02, 0x11, 0x22, 0x33, 0x44});

    TrailerData trailer;
    trailer.count = 2;
    trailer.items = {0xAA, 0xBB};
    trailer.crc = 0x1234;
    expect_bytes(result, "TrailerData crc after items", MsbSerializer::serialize(trailer),
                 {0x02, 0xAA, 0xBB, 0x12, 0x34});

    auto trailer_back = MsbSerializer::deserialize<TrailerData>(std::vector<uint8_t>{0x01, 0x7F, 0xBE, 0xEF});
    if (trailer_back.items == std::vector<uint8_t>{0x7F} && trailer_back.crc == 0xBEEF) {
        result.pass("TrailerData decodes crc at anchored offset");
    } else {
        result.fail("TrailerData decode wrong");
    }

    if (MsbSerializer::bit_length(trailer) == 40) {
        result.pass("bit_length of TrailerData with 2 items is 40");
    } else {
        result.fail("bit_length of TrailerData: " + std::to_string(MsbSerializer::bit_length(trailer)));
    }

    TwoListData two;
    two.first_count = 2;
    two.second_count = 1;
    two.first = {0x11, 0x22};
    two.middle = 0x33;
    two.second = {0xABC};
    two.tail = 0xD;
    const auto two_bytes = MsbSerializer::serialize(two);
    expect_bytes(result, "TwoListData", two_bytes, {0x21, 0x11, 0x22, 0x33, 0xAB, 0xCD});

    auto two_back = MsbSerializer::deserialize<TwoListData>(two_bytes);
    if (two_back.first == two.first && two_back.middle == 0x33 &&
        two_back.second == std::vector<uint16_t>{0xABC} && two_back.tail == 0xD) {
        result.pass("TwoListData decodes both lists and the fields between");
    } else {
        result.fail("TwoListData decode wrong");
    }
}

// Test 4: Fixed counts and arrays
void test_fixed_counts(TestResult& result) {
    std::cout << "\n=== Test 4: Fixed Counts and Arrays ===\n";

    FixedCountListData fixed;
    fixed.header = 0xAA;
    fixed.items = {0x11, 0x22, 0x33};
    expect_bytes(result, "FixedCountListData", MsbSerializer::serialize(fixed), {0xAA, 0x11, 0x22, 0x33});

    auto fixed_back = MsbSerializer::deserialize<FixedCountListData>(std::vector<uint8_t>{0xAA, 0x11, 0x22, 0x33});
    if (fixed_back.items == std::vector<uint8_t>{0x11, 0x22, 0x33}) {
        result.pass("FixedCountListData decodes exactly 3 items");
    } else {
        result.fail("FixedCountListData decode wrong");
    }

    auto nested_back = MsbSerializer::deserialize<FixedCountNestedListData>(
        std::vector<uint8_t>{0xFF, 0x01, 0x02, 0x03, 0x04});
    if (nested_back.items.size() == 2 && nested_back.items[1].x == 0x03 && nested_back.items[1].y == 0x04) {
        result.pass("FixedCountNestedListData decodes 2 records");
    } else {
        result.fail("FixedCountNestedListData decode wrong");
    }

    auto priority = MsbSerializer::deserialize<FixedCountPriorityData>(std::vector<uint8_t>{0x05, 0xAA, 0xBB});
    if (priority.count == 5 && priority.items == std::vector<uint8_t>{0xAA, 0xBB}) {
        result.pass("Fixed count 2 wins over count field value 5");
    } else {
        result.fail("FixedCountPriorityData decode wrong");
    }

    FixedCountCustomBitData nibbles;
    nibbles.prefix = 0xA;
    nibbles.nibbles = {1, 2, 3};
    expect_bytes(result, "FixedCountCustomBitData 4-bit elements", MsbSerializer::serialize(nibbles), {0xA1, 0x23});

    FixedCountArrayData arr;
    arr.header = 0xAA;
    arr.items = {1, 2, 3};
    expect_bytes(result, "FixedCountArrayData", MsbSerializer::serialize(arr), {0xAA, 0x01, 0x02, 0x03});

    ArrayData counted;
    counted.count = 3;
    counted.items = {1, 2, 3, 9, 9, 9, 9, 9};
    expect_bytes(result, "ArrayData writes only 'count' elements", MsbSerializer::serialize(counted),
                 {0x30, 0x01, 0x02, 0x03});

    auto counted_back = MsbSerializer::deserialize<ArrayData>(std::vector<uint8_t>{0x20, 0x07, 0x08});
    if (counted_back.items[0] == 7 && counted_back.items[1] == 8 && counted_back.items[2] == 0 &&
        counted_back.items[7] == 0) {
        result.pass("ArrayData decode fills 2 elements, rest default");
    } else {
        result.fail("ArrayData decode wrong");
    }

    auto nested_arr = MsbSerializer::deserialize<NestedArrayData>(std::vector<uint8_t>{0x02, 0x01, 0x02, 0x03, 0x04});
    if (nested_arr.items[1].x == 3 && nested_arr.items[1].y == 4 && nested_arr.items[2].x == 0) {
        result.pass("NestedArrayData decodes 2 of 4 records");
    } else {
        result.fail("NestedArrayData decode wrong");
    }

    TestData td;
    for (uint8_t i = 0; i < 12; ++i) {
        td.no_mean.push_back(i);
    }
    td.sys_run_id = 0x123456789ABCDEF0ULL;
    const auto td_bytes = MsbSerializer::serialize(td);
    const std::vector<uint8_t> id_bytes(td_bytes.begin() + 12, td_bytes.end());
    if (td_bytes.size() == 20 && td_bytes[11] == 11 &&
        id_bytes == std::vector<uint8_t>{0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0}) {
        result.pass("TestData: 12 bytes then big-endian 64-bit id (20 bytes)");
    } else {
        result.fail("TestData bytes: " + hex_bytes(td_bytes));
    }
}

// Test 5: Polymorphic slots
void test_polymorphic(TestResult& result) {
    std::cout << "\n=== Test 5: Polymorphic Slots ===\n";

    PolymorphicContainer a;
    a.message_type = 1;
    auto msg_a = std::make_unique<MessageTypeA>();
    msg_a->common_field = 0xAA;
    msg_a->field_a = 0xBB;
    a.message = std::move(msg_a);
    expect_bytes(result, "Variant A padded to 24-bit slot", MsbSerializer::serialize(a), {0x01, 0xAA, 0xBB, 0x00});

    PolymorphicContainer b;
    b.message_type = 2;
    auto msg_b = std::make_unique<MessageTypeB>();
    msg_b->common_field = 0xCC;
    msg_b->field_b = 0x1234;
    b.message = std::move(msg_b);
    expect_bytes(result, "Variant B", MsbSerializer::serialize(b), {0x02, 0xCC, 0x12, 0x34});

    auto c = MsbSerializer::deserialize<PolymorphicContainer>(std::vector<uint8_t>{0x03, 0xDD, 0xEE, 0xFF});
    auto* msg_c = dynamic_cast<MessageTypeC*>(c.message.get());
    if (msg_c && msg_c->common_field == 0xDD && msg_c->field_c1 == 0xEE && msg_c->field_c2 == 0xFF) {
        result.pass("Discriminator 3 decodes MessageTypeC");
    } else {
        result.fail("MessageTypeC decode wrong");
    }

    auto autolen = MsbSerializer::deserialize<PolymorphicContainerAutoLength>(
        std::vector<uint8_t>{0x02, 0x11, 0x22, 0x33});
    auto* auto_b = dynamic_cast<MessageTypeB*>(autolen.message.get());
    if (auto_b && auto_b->common_field == 0x11 && auto_b->field_b == 0x2233) {
        result.pass("Widest-variant slot decodes MessageTypeB");
    } else {
        result.fail("AutoLength decode wrong");
    }

    expect_error(result, "Discriminator 99 has no mapping", ErrorKind::UnknownVariant, [] {
        MsbSerializer::deserialize<PolymorphicContainer>(std::vector<uint8_t>{0x63, 0x00, 0x00, 0x00});
    }, "99");
}

// Test 6: Value converters
void test_converters(TestResult& result) {
    std::cout << "\n=== Test 6: Value Converters ===\n";

    auto single = MsbSerializer::deserialize<DataWithConverter>(std::vector<uint8_t>{0xAA, 0x05, 0xBB});
    if (single.header == 0xAA && single.converted_value == 15 && single.footer == 0xBB) {
        result.pass("Offset converter: raw 5 decodes as 15");
    } else {
        result.fail("DataWithConverter decode got " + std::to_string(single.converted_value));
    }
    expect_bytes(result, "Offset converter on encode", MsbSerializer::serialize(single), {0xAA, 0x05, 0xBB});

    auto multi = MsbSerializer::deserialize<DataWithMultipleConverters>(std::vector<uint8_t>{0x0A, 0xF0, 0x33});
    if (multi.offset_field == 20 && multi.inverted_field == 0x0F && multi.normal_field == 0x33) {
        result.pass("Two converters plus a plain field: 20, 0F, 33");
    } else {
        result.fail("DataWithMultipleConverters decode wrong");
    }

    auto doubled = MsbSerializer::deserialize<DataWithUShortConverter>(std::vector<uint8_t>{0x01, 0x00, 0x64});
    if (doubled.doubled_value == 200) {
        result.pass("16-bit converter: raw 100 decodes as 200");
    } else {
        result.fail("DataWithUShortConverter got " + std::to_string(doubled.doubled_value));
    }
    expect_bytes(result, "16-bit converter on encode", MsbSerializer::serialize(doubled), {0x01, 0x00, 0x64});

    auto nested = MsbSerializer::deserialize<NestedDataWithConverter>(std::vector<uint8_t>{0xAA, 0x05, 0x22, 0xBB});
    if (nested.inner.x == 15 && nested.inner.y == 0x22 && nested.footer == 0xBB) {
        result.pass("Converter inside a nested record");
    } else {
        result.fail("NestedDataWithConverter decode wrong");
    }

    RejectZeroData zero;
    expect_error(result, "Converter exception", ErrorKind::ConverterFailed,
                 [&] { MsbSerializer::serialize(zero); }, "zero has no raw form");
}

// Test 7: Signed members
void test_signed(TestResult& result) {
    std::cout << "\n=== Test 7: Signed Members ===\n";

    SignedData s;
    s.small = -5;
    s.medium = -300;
    s.large = -70000;
    s.huge = -1234567890123LL;
    s.nibble = -1;
    s.pad = 0;

    const auto bytes = MsbSerializer::serialize(s);
    auto back = MsbSerializer::deserialize<SignedData>(bytes);
    if (bytes.size() == 16 && back.small == -5 && back.medium == -300 && back.large == -70000 &&
        back.huge == -1234567890123LL) {
        result.pass("Full-width signed members survive");
    } else {
        result.fail("Signed decode wrong: " + hex_bytes(bytes));
    }

    if (back.nibble == 15 && bytes[15] == 0xF0) {
        result.pass("int8 -1 in 4 bits decodes as 15 (no sign extension)");
    } else {
        result.fail("4-bit signed decode got " + std::to_string(back.nibble));
    }
}

// Test 8: Bit offsets
void test_bit_offsets(TestResult& result) {
    std::cout << "\n=== Test 8: Non-Zero Bit Offsets ===\n";

    SimpleData2 v;
    v.header = 0xA;
    v.value = 0x58;
    v.footer = 0x12;

    std::vector<uint8_t> buf(3, 0);
    const size_t written = MsbSerializer::serialize_into(v, buf.data(), buf.size(), 4);
    if (written == 16) {
        result.pass("serialize_into reports 16 bits");
    } else {
        result.fail("serialize_into reported " + std::to_string(written));
    }
    expect_bytes(result, "SimpleData2 at bit 4", buf, {0x0A, 0xB1, 0x20});

    SimpleData2 back;
    const size_t read = MsbSerializer::deserialize_into(back, buf.data(), buf.size(), 4);
    if (read == 16 && back.header == 0xA && back.value == 0x58 && back.footer == 0x12) {
        result.pass("deserialize_into at bit 4");
    } else {
        result.fail("deserialize_into at bit 4 wrong");
    }

    ListData list;
    list.count = 1;
    list.items = {0xFF};
    std::vector<uint8_t> shifted(3, 0);
    MsbSerializer::serialize_into(list, shifted.data(), shifted.size(), 4);
    expect_bytes(result, "ListData at bit 4", shifted, {0x01, 0x0F, 0xF0});
}

// Test 9: Related field policy
void test_policy(TestResult& result) {
    std::cout << "\n=== Test 9: Related Field Policy ===\n";

    codec::CodecOptions lenient;
    lenient.related_field_policy = codec::RelatedFieldPolicy::Lenient;

    ListData list;
    list.count = 2;
    list.items = {0x11, 0x22, 0x33};
    expect_error(result, "Strict: count 2 with 3 items", ErrorKind::CountMismatch,
                 [&] { MsbSerializer::serialize(list); }, "count");
    expect_bytes(result, "Lenient: count 2 writes 2 of 3 items", MsbSerializer::serialize(list, lenient),
                 {0x20, 0x11, 0x22});

    list.count = 4;
    expect_error(result, "Lenient: count beyond list size", ErrorKind::CountMismatch,
                 [&] { MsbSerializer::serialize(list, lenient); });

    FixedCountListData short_fixed;
    short_fixed.items = {1, 2};
    expect_error(result, "Fixed count 3 with 2 items", ErrorKind::CountMismatch,
                 [&] { MsbSerializer::serialize(short_fixed, lenient); }, "fixed count");

    PolymorphicContainer mismatched;
    mismatched.message_type = 2;
    auto msg = std::make_unique<MessageTypeA>();
    msg->common_field = 0xAA;
    msg->field_a = 0xBB;
    mismatched.message = std::move(msg);
    expect_error(result, "Strict: discriminator 2 with MessageTypeA", ErrorKind::DiscriminatorMismatch,
                 [&] { MsbSerializer::serialize(mismatched); }, "message_type");
    expect_bytes(result, "Lenient: discriminator written as-is", MsbSerializer::serialize(mismatched, lenient),
                 {0x02, 0xAA, 0xBB, 0x00});
}

// Test 10: Call-time errors
void test_errors(TestResult& result) {
    std::cout << "\n=== Test 10: Call-Time Errors ===\n";

    PolymorphicContainer empty_slot;
    empty_slot.message_type = 1;
    expect_error(result, "Null occupant", ErrorKind::UnknownVariant,
                 [&] { MsbSerializer::serialize(empty_slot); });

    PolymorphicContainer unmapped;
    unmapped.message_type = 4;
    unmapped.message = std::make_unique<MessageTypeD>();
    expect_error(result, "Unmapped occupant MessageTypeD", ErrorKind::UnknownVariant,
                 [&] { MsbSerializer::serialize(unmapped); });

    SimpleData simple;
    uint8_t small_buf[3] = {0x5A, 0x5A, 0x5A};
    expect_error(result, "3-byte buffer for 4-byte record", ErrorKind::BufferTooSmall,
                 [&] { MsbSerializer::serialize(simple, small_buf, sizeof(small_buf)); });
    if (small_buf[0] == 0x5A && small_buf[1] == 0x5A && small_buf[2] == 0x5A) {
        result.pass("BufferTooSmall leaves the buffer untouched");
    } else {
        result.fail("BufferTooSmall modified the buffer");
    }

    expect_error(result, "Decode from short buffer", ErrorKind::BitRangeOutOfBounds, [] {
        MsbSerializer::deserialize<SimpleData>(std::vector<uint8_t>{0xAB, 0x12, 0x34});
    });
    expect_error(result, "Decode list past buffer end", ErrorKind::BitRangeOutOfBounds, [] {
        MsbSerializer::deserialize<ListData>(std::vector<uint8_t>{0x30, 0x11});
    });

    ArrayData over;
    over.count = 9;
    expect_error(result, "Array count 9 over capacity 8 on encode", ErrorKind::CountMismatch,
                 [&] { MsbSerializer::serialize(over); }, "capacity");
    expect_error(result, "Array count 9 over capacity 8 on decode", ErrorKind::CountMismatch, [] {
        MsbSerializer::deserialize<ArrayData>(std::vector<uint8_t>{0x90, 0, 0, 0, 0, 0, 0, 0, 0, 0});
    }, "capacity");

    expect_error(result, "Count 0xFFFFFFF0 from a 4-byte buffer", ErrorKind::BitRangeOutOfBounds, [] {
        MsbSerializer::deserialize<WordListData>(std::vector<uint8_t>{0xFF, 0xFF, 0xFF, 0xF0});
    }, "WordListData.words");
    expect_error(result, "Count 255 of 16-bit records from 1 spare byte", ErrorKind::BitRangeOutOfBounds, [] {
        MsbSerializer::deserialize<ListNestedData>(std::vector<uint8_t>{0xFF, 0x01});
    }, "ListNestedData.items");

    try {
        const WordListData two = MsbSerializer::deserialize<WordListData>(
            std::vector<uint8_t>{0x00, 0x00, 0x00, 0x02, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88});
        if (two.words.size() == 2 && two.words[0] == 0x11223344u && two.words[1] == 0x55667788u) {
            result.pass("Count that exactly fills the buffer decodes");
        } else {
            result.fail("Exact-fit word list decoded wrong");
        }
    } catch (const std::exception& e) {
        result.fail(std::string("Exact-fit word list threw: ") + e.what());
    }

    WideByteData wide;
    expect_error(result, "9 bits declared on a uint8_t", ErrorKind::BitRangeOutOfBounds,
                 [&] { MsbSerializer::serialize(wide); }, "WideByteData.value");
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║            MSB Record Codec Unit Tests                      ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    utils::set_level(utils::LogLevel::Error);

    TestResult result;

    test_flat_records(result);
    test_nested_records(result);
    test_dynamic_lists(result);
    test_fixed_counts(result);
    test_polymorphic(result);
    test_converters(result);
    test_signed(result);
    test_bit_offsets(result);
    test_policy(result);
    test_errors(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
