#include <gtest/gtest.h>

#include "rnm/target/skip_set.hpp"
#include "rnm/target/target.hpp"

using namespace rnm;

TEST(Target, TextForms) {
    ModuleAddr m{IdString("Foo"), IdString("Bar")};
    EXPECT_EQ(Target(CircuitAddr{IdString("Foo")}).toString(), "~Foo");
    EXPECT_EQ(Target(m).toString(), "~Foo|Bar");
    EXPECT_EQ(Target(m.instOf(IdString("u"), IdString("Baz"))).toString(),
              "~Foo|Bar/u:Baz");
    EXPECT_EQ(Target(m.ref(IdString("mem")).field(IdString("r"))).toString(),
              "~Foo|Bar>mem.r");
}

TEST(Target, ParseAllShapes) {
    for (const char* text :
         {"~Foo", "~Foo|Bar", "~Foo|Foo/bar:Bar", "~Foo|Foo>w",
          "~Foo|Foo>m.r.addr", "~Foo|Foo/a:A/b:B", "~Foo|Foo/a:A>x.y"}) {
        EXPECT_EQ(parseTarget(text).toString(), text);
    }

    Target t = parseTarget("~Foo|Foo/a:A/b:B");
    ASSERT_TRUE(t.is<InstanceAddr>());
    const auto& ia = t.as<InstanceAddr>();
    ASSERT_EQ(ia.mPath.size(), 1u);
    EXPECT_EQ(ia.mPath[0].mInstance, IdString("a"));
    EXPECT_EQ(ia.mInstance, IdString("b"));
    EXPECT_EQ(ia.mOfModule, IdString("B"));
    EXPECT_FALSE(t.isLocal());

    Target r = parseTarget("~Foo|Foo>m.r");
    ASSERT_TRUE(r.is<ReferenceAddr>());
    EXPECT_EQ(r.as<ReferenceAddr>().mRef, IdString("m"));
    EXPECT_TRUE(r.isLocal());
    EXPECT_EQ(r.circuitName(), IdString("Foo"));
    EXPECT_TRUE(r.moduleAddr() ==
                (ModuleAddr{IdString("Foo"), IdString("Foo")}));
    EXPECT_FALSE(parseTarget("~Foo").moduleAddr().has_value());
}

TEST(Target, ParseRejectsMalformed) {
    for (const char* text :
         {"", "Foo", "~", "~Foo|", "~Foo|Bar/u", "~Foo|Bar>", "~Foo|Bar>a..b",
          "~Foo|Bar/u:U:V"}) {
        EXPECT_THROW(parseTarget(text), ConfigError) << text;
    }
}

TEST(Target, LeafName) {
    ModuleAddr m{IdString("C"), IdString("M")};
    EXPECT_EQ(Target(m).leafName(), IdString("M"));
    EXPECT_EQ(Target(m.ref(IdString("w"))).leafName(), IdString("w"));

    Target port = m.ref(IdString("mem")).field(IdString("rd"));
    EXPECT_EQ(port.leafName(), IdString("rd"));
    EXPECT_EQ(port.withLeafName(IdString("rd2")).toString(), "~C|M>mem.rd2");

    Target inst = m.instOf(IdString("u"), IdString("Sub"));
    EXPECT_EQ(inst.withLeafName(IdString("v")).toString(), "~C|M/v:Sub");

    Target deep = m.ref(IdString("mem")).field(IdString("rd")).field(
      IdString("addr"));
    EXPECT_THROW(deep.leafName(), InternalError);
    EXPECT_THROW(deep.withLeafName(IdString("x")), InternalError);
}

TEST(Target, HashAndEquality) {
    Target a = parseTarget("~Foo|Bar>x");
    Target b = ModuleAddr{IdString("Foo"), IdString("Bar")}.ref(IdString("x"));
    EXPECT_EQ(a, b);
    EXPECT_EQ(Target::Hash{}(a), Target::Hash{}(b));
    // Same text pieces, different variant
    EXPECT_NE(parseTarget("~Foo|Bar"), parseTarget("~Foo|Bar>Bar"));
}

TEST(SkipSet, AcceptsLocalTargets) {
    SkipSet s{parseTarget("~Foo"), parseTarget("~Foo|Bar"),
              parseTarget("~Foo|Foo/bar:Bar"), parseTarget("~Foo|Foo>m.r")};
    EXPECT_EQ(s.size(), 4u);
    EXPECT_TRUE(s.contains(parseTarget("~Foo|Bar")));
    EXPECT_FALSE(s.contains(parseTarget("~Foo|Baz")));

    auto sorted = s.sorted();
    ASSERT_EQ(sorted.size(), 4u);
    EXPECT_EQ(sorted.front().toString(), "~Foo");

    EXPECT_TRUE(s.remove(parseTarget("~Foo")));
    EXPECT_FALSE(s.remove(parseTarget("~Foo")));
    EXPECT_EQ(s.size(), 3u);
}

TEST(SkipSet, RejectsNonLocalTargets) {
    SkipSet s;
    EXPECT_THROW(s.add(parseTarget("~Foo|Foo/a:A/b:B")), InvalidAddressError);
    EXPECT_THROW(s.add(parseTarget("~Foo|Foo/a:A>x")), InvalidAddressError);
    EXPECT_TRUE(s.empty());
    EXPECT_THROW(SkipSet({parseTarget("~Foo|Bar"), parseTarget("~Foo|Foo/a:A>x")}),
                 InvalidAddressError);
}
