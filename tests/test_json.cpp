#include <iostream>
#include <string>

#include "turngate/util/json.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_json() {
  using namespace turngate;

  // Keys come out sorted and integral numbers print without a fraction.
  {
    json::Object o;
    o["zeta"] = 3;
    o["alpha"] = 2.5;
    o["mid"] = json::Array{true, nullptr, "x"};
    TG_ASSERT(json::stringify(o, 0) == "{\"alpha\":2.5,\"mid\":[true,null,\"x\"],\"zeta\":3}");
  }

  // Pretty output.
  {
    json::Object o;
    o["a"] = 1;
    TG_ASSERT(json::stringify(o, 2) == "{\n  \"a\": 1\n}");
    TG_ASSERT(json::stringify(json::Object{}, 2) == "{}");
  }

  // Escapes and unicode.
  {
    const json::Value v = json::parse("\"line\\nbreak \\u00e9 \\ud83d\\ude00\"");
    TG_ASSERT(v.is_string());
    TG_ASSERT(v.string_value() == "line\nbreak \xC3\xA9 \xF0\x9F\x98\x80");
    TG_ASSERT(json::stringify(json::Value(std::string("tab\there"))) == "\"tab\\there\"");
  }

  // UTF-8 BOM is skipped.
  {
    const json::Value v = json::parse("\xEF\xBB\xBF{\"k\": [1, 2]}");
    TG_ASSERT(v.is_object());
    TG_ASSERT(v.at("k").at(1).int_value() == 2);
  }

  // Accessors.
  {
    const json::Value v = json::parse("{\"n\": -7, \"f\": 0.25, \"s\": \"hi\", \"b\": false}");
    TG_ASSERT(v.at("n").int_value() == -7);
    TG_ASSERT(v.at("f").number_value() == 0.25);
    TG_ASSERT(v.at("s").string_value() == "hi");
    TG_ASSERT(v.at("b").is_bool() && !v.at("b").bool_value(true));
    TG_ASSERT(v.find("missing") == nullptr);
    TG_ASSERT(json::is_integral(-7.0));
    TG_ASSERT(!json::is_integral(0.25));

    bool threw = false;
    try {
      (void)v.at("missing");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    TG_ASSERT(threw);
  }

  // Text survives a parse/stringify cycle unchanged.
  {
    const std::string text = "{\"a\":[1,2,{\"b\":null}],\"c\":\"d\"}";
    TG_ASSERT(json::stringify(json::parse(text), 0) == text);
  }

  return 0;
}
