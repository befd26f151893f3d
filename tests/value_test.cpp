#include "protocol/value.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <variant>

namespace resp::protocol {

// ── Equality ──────────────────────────────────────────────────────────────────

TEST(ValueEquality, SameVariantSamePayload) {
    EXPECT_EQ(Value{SimpleString{"OK"}}, Value{SimpleString{"OK"}});
    EXPECT_EQ(Value{Integer{-5}}, Value{Integer{-5}});
    EXPECT_EQ(Value{make_bulk("abc")}, Value{make_bulk("abc")});
}

TEST(ValueEquality, DifferentPayload) {
    EXPECT_NE(Value{SimpleString{"OK"}}, Value{SimpleString{"ok"}});
    EXPECT_NE(Value{Integer{1}}, Value{Integer{2}});
}

TEST(ValueEquality, SamePayloadDifferentVariant) {
    EXPECT_NE(Value{SimpleString{"OK"}}, Value{SimpleError{"OK"}});
    EXPECT_NE(Value{SimpleString{"OK"}}, Value{make_bulk("OK")});
}

TEST(ValueEquality, ArraysCompareElementwise) {
    Value a = Array{{Integer{1}, Array{{make_bulk("x")}}}};
    Value b = Array{{Integer{1}, Array{{make_bulk("x")}}}};
    Value c = Array{{Integer{1}, Array{{make_bulk("y")}}}};
    Value d = Array{{Integer{1}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(Value{Array{}}, Value{Array{}});
}

TEST(ValueEquality, CopyIsDeep) {
    Value original = Array{{make_bulk("x")}};
    Value copy = original;
    copy.as<Array>().elements.push_back(Integer{1});

    EXPECT_EQ(original.as<Array>().elements.size(), 1u);
    EXPECT_NE(original, copy);
}

// ── Type queries ──────────────────────────────────────────────────────────────

TEST(ValueTypeQuery, TypeMatchesVariant) {
    EXPECT_EQ(Value{SimpleString{}}.type(), ValueType::String);
    EXPECT_EQ(Value{SimpleError{}}.type(),  ValueType::Error);
    EXPECT_EQ(Value{Integer{}}.type(),      ValueType::Integer);
    EXPECT_EQ(Value{BulkString{}}.type(),   ValueType::BulkString);
    EXPECT_EQ(Value{Array{}}.type(),        ValueType::Array);
}

TEST(ValueTypeQuery, IsAndAs) {
    Value v = Integer{42};
    EXPECT_TRUE(v.is<Integer>());
    EXPECT_FALSE(v.is<SimpleString>());
    EXPECT_EQ(v.as<Integer>().value, 42);
    EXPECT_THROW((void)v.as<BulkString>(), std::bad_variant_access);
}

TEST(ValueTypeQuery, Names) {
    EXPECT_EQ(type_name(ValueType::String),     "String");
    EXPECT_EQ(type_name(ValueType::Error),      "Error");
    EXPECT_EQ(type_name(ValueType::Integer),    "Integer");
    EXPECT_EQ(type_name(ValueType::BulkString), "BulkString");
    EXPECT_EQ(type_name(ValueType::Array),      "Array");
}

TEST(ValueTypeQuery, BulkView) {
    auto b = make_bulk(std::string_view{"a\0b", 3});
    EXPECT_EQ(b.bytes.size(), 3u);
    EXPECT_EQ(b.view(), std::string_view("a\0b", 3));
}

// ── Debug formatting ──────────────────────────────────────────────────────────

TEST(ValueToString, Scalars) {
    EXPECT_EQ(to_string(SimpleString{"OK"}), "String(\"OK\")");
    EXPECT_EQ(to_string(SimpleError{"ERR x"}), "Error(\"ERR x\")");
    EXPECT_EQ(to_string(Integer{-7}), "Integer(-7)");
    EXPECT_EQ(to_string(make_bulk("ECHO")), "BulkString(\"ECHO\")");
}

TEST(ValueToString, EscapesControlBytes) {
    auto b = make_bulk(std::string_view{"a\r\n\t\"\\\x01\x7f", 8});
    EXPECT_EQ(to_string(b), R"(BulkString("a\r\n\t\"\\\x01\x7f"))");
}

TEST(ValueToString, NestedArray) {
    Value v = Array{{make_bulk("ECHO"), Array{{Integer{1}, Integer{2}}}, Array{}}};
    EXPECT_EQ(to_string(v),
              "Array([BulkString(\"ECHO\"), Array([Integer(1), Integer(2)]), Array([])])");
}

TEST(ValueToString, PrintToUsesDebugForm) {
    std::ostringstream oss;
    PrintTo(Value{Integer{3}}, &oss);
    EXPECT_EQ(oss.str(), "Integer(3)");
}

// ── Reply formatting ──────────────────────────────────────────────────────────

TEST(ValueFormatReply, Scalars) {
    EXPECT_EQ(format_reply(SimpleString{"OK"}), "\"OK\"");
    EXPECT_EQ(format_reply(SimpleError{"ERR unknown"}), "(error) ERR unknown");
    EXPECT_EQ(format_reply(Integer{1000}), "(integer) 1000");
    EXPECT_EQ(format_reply(make_bulk("hello\n")), "\"hello\\n\"");
}

TEST(ValueFormatReply, EmptyArray) {
    EXPECT_EQ(format_reply(Array{}), "(empty array)");
}

TEST(ValueFormatReply, FlatArray) {
    Value v = Array{{make_bulk("ECHO"), make_bulk("hey")}};
    EXPECT_EQ(format_reply(v), "1) \"ECHO\"\n2) \"hey\"");
}

TEST(ValueFormatReply, NestedArrayIsIndented) {
    Value v = Array{{
        make_bulk("a"),
        Array{{Integer{1}, Integer{2}}},
        Array{},
    }};
    EXPECT_EQ(format_reply(v),
              "1) \"a\"\n"
              "2) 1) (integer) 1\n"
              "   2) (integer) 2\n"
              "3) (empty array)");
}

TEST(ValueFormatReply, IndexesArePaddedToWidestIndex) {
    Array a;
    for (int i = 0; i < 10; ++i) {
        a.elements.push_back(Integer{i});
    }
    const auto out = format_reply(a);
    EXPECT_EQ(out.substr(0, out.find('\n')), " 1) (integer) 0");
    EXPECT_EQ(out.substr(out.rfind('\n') + 1), "10) (integer) 9");
}

} // namespace resp::protocol
