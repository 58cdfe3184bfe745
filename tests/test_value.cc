/*
 * test_value.cc -- attribute value semantics
 *
 * Copyright (C) 2026 The Clearance developers
 *
 * This file is part of the Clearance library libclearance. Please see README
 * for terms of use.
 */

#include <sstream>

#include <catch2/catch.hpp>
#include "test.hh"

using namespace clearance;

SCENARIO( "Values compare by type and content", "[value]" ) {
  GIVEN("numbers of different representation") {
    THEN("integers and reals compare numerically") {
      REQUIRE(Value(12) == Value(12.0));
      REQUIRE(Value(12) != Value(12.5));
      REQUIRE(Value(3).compare(Value(4.5)) == -1);
      REQUIRE(Value(4.5).compare(Value(3)) == 1);
    }
    THEN("booleans never equal numbers") {
      REQUIRE(Value(true) != Value(1));
      REQUIRE(Value(false) != Value(0));
      REQUIRE_FALSE(Value(true).compare(Value(1)).has_value());
    }
  }

  GIVEN("strings") {
    THEN("equality is exact and ordering is lexicographic") {
      REQUIRE(Value("admin") == Value(std::string("admin")));
      REQUIRE(Value("admin") != Value("Admin"));
      REQUIRE(Value("a").compare(Value("b")) == -1);
    }
    THEN("strings and numbers are not ordered") {
      REQUIRE_FALSE(Value("12").compare(Value(9)).has_value());
      REQUIRE(Value("12") != Value(12));
    }
  }

  GIVEN("values of each kind") {
    THEN("the type predicates tell integers and reals apart") {
      REQUIRE(Value(3).is_integer());
      REQUIRE_FALSE(Value(3).is_real());
      REQUIRE(Value(3.0).is_real());
      REQUIRE_FALSE(Value(3.0).is_integer());
      REQUIRE(Value(3).is_number());
      REQUIRE(Value(3.0).is_number());
      REQUIRE_FALSE(Value(true).is_integer());
      REQUIRE_FALSE(Value("3").is_integer());
    }
  }

  GIVEN("null values") {
    THEN("null equals only null") {
      REQUIRE(Value() == Value(nullptr));
      REQUIRE(Value() != Value(""));
      REQUIRE(Value() != Value(0));
      REQUIRE_FALSE(Value().compare(Value()).has_value());
    }
  }

  GIVEN("a list of values") {
    const Value list{ "a", 2, 3.5 };

    THEN("membership uses value equality") {
      REQUIRE(list.is_list());
      REQUIRE(list.as_list().size() == 3);
      REQUIRE(list.contains(Value("a")));
      REQUIRE(list.contains(Value(2.0)));
      REQUIRE_FALSE(list.contains(Value("c")));
    }
    THEN("scalars contain nothing") {
      REQUIRE_FALSE(Value("abc").contains(Value("a")));
    }
    THEN("it prints in JSON-like form") {
      std::ostringstream os;
      os << list;
      REQUIRE(os.str() == "[\"a\", 2, 3.5]");
    }
  }
}

SCENARIO( "Attribute lookup", "[value]" ) {
  GIVEN("an attribute bucket") {
    const Attributes attrs{ { "id", "u1" }, { "level", 3 } };

    THEN("present attributes are returned") {
      REQUIRE(lookup(attrs, "id") == Value("u1"));
      REQUIRE(lookup(attrs, "level").as_integer() == 3);
    }
    THEN("missing attributes are null") {
      REQUIRE(lookup(attrs, "region").is_null());
    }
  }
}
