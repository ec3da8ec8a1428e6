#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <yaml-cpp/yaml.h>
#include <yaml-select/yaml-select.h>
#include <yaml-select/yaml-pathquery.h>
#include <yaml-select/yaml-select-internals.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <limits>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <strings.h>

using namespace YamlSelect;

namespace YamlSelect
{
   template <typename TEnum>
   doctest::String DT2String(TEnum value, std::initializer_list<std::pair<TEnum, char const *>> map)
   {
      char const * p = YamlSelectDetail::MapValue(value, map);
      if (p)
         return p;

      std::stringstream str;
      str << "(" << (int)value << ")";
      return str.str().c_str();
   }

   doctest::String toString(EQueryError value) { return DT2String(value, YamlSelectDetail::MapEQueryErrorName); }

   namespace YamlSelectDetail
   {
      doctest::String toString(EToken value) { return DT2String(value, MapETokenName); }
      doctest::String toString(EValueKind value) { return DT2String(value, MapEValueKindName); }
   }
}

namespace
{
   using Strings = std::vector<std::string>;

   std::string Text(Node const & node)
   {
      if (node.IsScalar())
         return node.Scalar();
      if (node.IsNull())
         return "~";
      YAML::Emitter out;
      out << YAML::Flow << node;
      return out.c_str();
   }

   Strings Texts(Selection const & selection)
   {
      Strings result;
      for (auto && item : selection)
         result.push_back(Text(item));
      return result;
   }

   /// runs \c f, and returns the error code of the QueryException it throws
   template <typename TFunc>
   EQueryError ErrorOf(TFunc && f)
   {
      try
      {
         f();
      }
      catch (QueryException const & x)
      {
         return x.Error();
      }
      return EQueryError::OK;
   }

   char const * sampleBooks = R"(
store:
  books:
    - { author: Evelyn, title: Sayings, price: 8.95, tags: [classic, poetry] }
    - { author: Nigel, title: Sword, price: 12.99, tags: [fiction] }
    - { author: Herman, title: Moby Dick, price: 8, isbn: "0-553-21311-3", tags: [] }
  bicycle: { color: red, price: 19.95 }
name: shop
)";
}


// ---- parse level 0: SplitAt, Split
TEST_CASE("Internal: SplitAt")
{
   using namespace YamlSelectDetail;

   auto Check = [](PathArg p, size_t offset, PathArg expectedResult, PathArg expectedP)
   {
      CHECK(p.size() == expectedResult.size() + expectedP.size());
      auto result = SplitAt(p, offset);
      CHECK(result == expectedResult);
      CHECK(p == expectedP);
   };

   Check("", 0, "", "");
   Check("", 1, "", "");

   Check("a", 0, "", "a");
   Check("a", 1, "a", "");
   Check("a", 2, "a", "");

   Check("abc", 0, "", "abc");
   Check("abc", 1, "a", "bc");
   Check("abc", 3, "abc", "");
   Check("abc", 4, "abc", "");
}

TEST_CASE("Internal: Split")
{
   using namespace YamlSelectDetail;

   PathArg p = "12ab";
   CHECK(Split(p, [](char c) { return isdigit(c) != 0; }) == "12");
   CHECK(p == "ab");

   p = "";
   CHECK(Split(p, [](char c) { return isdigit(c) != 0; }) == "");
}


// ---- values
TEST_CASE("Internal: KindOf")
{
   using namespace YamlSelectDetail;

   auto n = YAML::Load(R"({ i: 12, neg: -3, f: 1.5, b: true, B: False, s: abc, q: "12", n: ~, t: !!str 7, seq: [], map: {} })");
   CHECK(KindOf(n["i"]) == EValueKind::Int);
   CHECK(KindOf(n["neg"]) == EValueKind::Int);
   CHECK(KindOf(n["f"]) == EValueKind::Float);
   CHECK(KindOf(n["b"]) == EValueKind::Bool);
   CHECK(KindOf(n["B"]) == EValueKind::Bool);
   CHECK(KindOf(n["s"]) == EValueKind::String);
   CHECK(KindOf(n["q"]) == EValueKind::String);
   CHECK(KindOf(n["n"]) == EValueKind::Null);
   CHECK(KindOf(n["t"]) == EValueKind::String);
   CHECK(KindOf(n["seq"]) == EValueKind::Sequence);
   CHECK(KindOf(n["map"]) == EValueKind::Map);
   CHECK(KindOf(n["missing"]) == EValueKind::Undefined);

   CHECK(KindOf(MakeString("12")) == EValueKind::String);
   CHECK(KindOf(MakeInt(12)) == EValueKind::Int);
   CHECK(KindOf(MakeFloat(2)) == EValueKind::Float);
   CHECK(MakeFloat(2).Scalar() == "2.0");
   CHECK(MakeFloat(0.5).Scalar() == "0.5");
   CHECK(KindOf(MakeBool(false)) == EValueKind::Bool);
   CHECK(KindOf(MakeNull()) == EValueKind::Null);
}

TEST_CASE("Internal: comparison and arithmetic")
{
   using namespace YamlSelectDetail;

   CHECK(Compare(ECompareOp::Equal, MakeInt(1), MakeFloat(1.0)));
   CHECK(Compare(ECompareOp::Equal, MakeBool(true), MakeInt(1)));
   CHECK(!Compare(ECompareOp::Equal, MakeInt(1), MakeString("1")));
   CHECK(Compare(ECompareOp::NotEqual, MakeInt(1), MakeString("1")));
   CHECK(Compare(ECompareOp::Less, MakeInt(1), MakeFloat(1.5)));
   CHECK(Compare(ECompareOp::GreaterEqual, MakeString("b"), MakeString("a")));
   CHECK(Compare(ECompareOp::Equal, YAML::Load("[1, {a: x}]"), YAML::Load("[1.0, {a: \"x\"}]")));
   CHECK(!Compare(ECompareOp::Equal, YAML::Load("{a: 1, b: 2}"), YAML::Load("{a: 1, c: 2}")));

   CHECK(ErrorOf([] { Compare(ECompareOp::Less, MakeInt(1), MakeString("a")); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([] { Compare(ECompareOp::Less, YAML::Load("[1]"), YAML::Load("[2]")); }) == EQueryError::TypeMismatch);

   CHECK(Arithmetic(EArithOp::Add, MakeInt(2), MakeInt(3)).Scalar() == "5");
   CHECK(Arithmetic(EArithOp::Multiply, MakeInt(2), MakeFloat(1.5)).Scalar() == "3.0");
   CHECK(Arithmetic(EArithOp::Divide, MakeInt(7), MakeInt(2)).Scalar() == "3.5");
   CHECK(KindOf(Arithmetic(EArithOp::Divide, MakeInt(4), MakeInt(2))) == EValueKind::Float);
   CHECK(Arithmetic(EArithOp::Modulo, MakeInt(-7), MakeInt(3)).Scalar() == "2");
   CHECK(Arithmetic(EArithOp::Modulo, MakeInt(7), MakeInt(-3)).Scalar() == "-2");
   CHECK(Arithmetic(EArithOp::Add, MakeString("ab"), MakeString("cd")).Scalar() == "abcd");
   CHECK(Negate(MakeInt(4)).Scalar() == "-4");

   CHECK(ErrorOf([] { Arithmetic(EArithOp::Divide, MakeInt(1), MakeInt(0)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([] { Arithmetic(EArithOp::Modulo, MakeInt(1), MakeInt(0)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([] { Arithmetic(EArithOp::Subtract, MakeString("a"), MakeInt(1)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([] { Negate(MakeString("a")); }) == EQueryError::TypeMismatch);

   // integer limits
   long long const maxInt = std::numeric_limits<long long>::max();
   long long const minInt = std::numeric_limits<long long>::min();
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Add, MakeInt(maxInt), MakeInt(1)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Add, MakeInt(minInt), MakeInt(-1)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Subtract, MakeInt(minInt), MakeInt(1)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Subtract, MakeInt(0), MakeInt(minInt)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Multiply, MakeInt(maxInt), MakeInt(2)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Multiply, MakeInt(minInt), MakeInt(-1)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Arithmetic(EArithOp::Multiply, MakeInt(-2), MakeInt(maxInt)); }) == EQueryError::TypeMismatch);
   CHECK(ErrorOf([&] { Negate(MakeInt(minInt)); }) == EQueryError::TypeMismatch);
   CHECK(Arithmetic(EArithOp::Add, MakeInt(maxInt), MakeInt(minInt)).Scalar() == "-1");
   CHECK(Arithmetic(EArithOp::Subtract, MakeInt(-1), MakeInt(minInt)).Scalar() == std::to_string(maxInt));
   CHECK(Arithmetic(EArithOp::Multiply, MakeInt(minInt), MakeInt(1)).Scalar() == std::to_string(minInt));
   CHECK(Arithmetic(EArithOp::Multiply, MakeInt(-3), MakeInt(-4)).Scalar() == "12");
   CHECK(Arithmetic(EArithOp::Modulo, MakeInt(minInt), MakeInt(-1)).Scalar() == "0");
   CHECK(Arithmetic(EArithOp::Modulo, MakeInt(minInt), MakeInt(maxInt)).Scalar() == std::to_string(maxInt - 1));
   CHECK(Negate(MakeInt(maxInt)).Scalar() == std::to_string(-maxInt));
}

TEST_CASE("PathQuery - integer limits in filters")
{
   Node root = YAML::Load("[ { a: -9223372036854775808 }, { a: 9223372036854775807 }, { a: 3 } ]");

   CHECK(Texts(Select(root, R"($[*][@."a" % -1 = 0]."a")")) == Strings{ "-9223372036854775808", "9223372036854775807", "3" });
   CHECK(Texts(Select(root, R"($[*][@."a" * 2 > 0]."a")")) == Strings{ "3" });
   CHECK(Texts(Select(root, R"($[*][@."a" + 1 > 0]."a")")) == Strings{ "3" });
   CHECK(Texts(Select(root, R"($[*][-@."a" < 0]."a")")) == Strings{ "9223372036854775807", "3" });
   CHECK(ErrorOf([&] { PathQuery().Test(R"(@."a" - 1 < 0)", Selection(root).Exp().I(0), Selection(root)); }) == EQueryError::TypeMismatch);
}

TEST_CASE("Internal: truthiness")
{
   using namespace YamlSelectDetail;

   CHECK(!IsTruthy(MakeNull()));
   CHECK(!IsTruthy(Node()));
   CHECK(!IsTruthy(MakeBool(false)));
   CHECK(!IsTruthy(MakeInt(0)));
   CHECK(!IsTruthy(MakeFloat(0)));
   CHECK(!IsTruthy(MakeString("")));
   CHECK(!IsTruthy(YAML::Load("[]")));
   CHECK(IsTruthy(MakeString("0")));
   CHECK(IsTruthy(MakeInt(-1)));
   CHECK(IsTruthy(YAML::Load("{a: 1}")));
}

TEST_CASE("Internal: SplitCodePoints")
{
   using namespace YamlSelectDetail;
   CHECK(SplitCodePoints("ab") == Strings{ "a", "b" });
   CHECK(SplitCodePoints(u8"äx€") == Strings{ u8"ä", "x", u8"€" });
   CHECK(SplitCodePoints("").empty());
}


// ---- classifier
TEST_CASE("Classify - default configuration")
{
   auto config = ClassifierConfig::Default();
   auto n = YAML::Load(R"({ m: {a: 1}, s: [1, 2], str: abc, i: 12, n: ~ })");

   CHECK(Classify(n["m"], config).byKey);
   CHECK(!Classify(n["m"], config).byIndex);
   CHECK(Classify(n["s"], config).byIndex);
   CHECK(!Classify(n["s"], config).byKey);
   CHECK(Classify(n["str"], config).IsOpaque());
   CHECK(Classify(n["i"], config).IsOpaque());
   CHECK(Classify(n["n"], config).IsOpaque());

   CHECK(ShapeTagsOf(n["str"]) == Strings{ "string", "scalar", "iterable" });
   CHECK(ShapeTagsOf(n["i"]) == Strings{ "scalar" });
}

TEST_CASE("Classify - custom tags")
{
   auto n = YAML::Load("{ bag: !bag [1, 2], plain: [3] }");
   CHECK(ShapeTagsOf(n["bag"]) == Strings{ "sequence", "iterable", "!bag" });

   auto config = ClassifierConfig::Default();
   config.excludedFromIndexIteration.insert("!bag");
   CHECK(Classify(n["bag"], config).IsOpaque());
   CHECK(Classify(n["plain"], config).byIndex);

   config.iterableByKey.insert("!bag");
   CHECK(Classify(n["bag"], config).byKey);
}

TEST_CASE("ClassifierConfig - FromYaml")
{
   auto config = ClassifierConfig::FromYaml(YAML::Load(R"(
iterable_by_index: [sequence]
excluded_from_index_iteration: []
max_depth: 12
)"));
   CHECK(config.iterableByIndex == ClassifierConfig::ShapeSet{ "sequence" });
   CHECK(config.excludedFromIndexIteration.empty());
   CHECK(config.iterableByKey == ClassifierConfig::ShapeSet{ "map" });    // not specified, keeps default
   CHECK(config.maxDepth == 12);

   CHECK(ErrorOf([] { ClassifierConfig::FromYaml(YAML::Load("[1, 2]")); }) == EQueryError::InvalidConfig);
   CHECK(ErrorOf([] { ClassifierConfig::FromYaml(YAML::Load("iterable_by_key: map")); }) == EQueryError::InvalidConfig);
   CHECK(ErrorOf([] { ClassifierConfig::FromYaml(YAML::Load("max_depth: deep")); }) == EQueryError::InvalidConfig);
}

TEST_CASE("ClassifierConfig - LoadFile")
{
   std::string path = "yaml-select-test-config.yaml";
   {
      std::ofstream out(path);
      out << "iterable_by_key: [map, sequence]\n";
   }
   auto config = ClassifierConfig::LoadFile(path);
   std::remove(path.c_str());
   CHECK(config.iterableByKey == ClassifierConfig::ShapeSet{ "map", "sequence" });

   CHECK(ErrorOf([] { ClassifierConfig::LoadFile("does-not-exist.yaml"); }) == EQueryError::InvalidConfig);
   CHECK(QueryException(EQueryError::InvalidConfig).IsConfigError());
   CHECK(!QueryException(EQueryError::TypeMismatch).IsConfigError());
}


// ---- Selection
TEST_CASE("Selection - One")
{
   Selection root(YAML::Load(sampleBooks));

   CHECK(Texts(root.One("name")) == Strings{ "shop" });
   CHECK(root.One("missing").Empty());
   CHECK(root.One("store").One("bicycle").One("color").Size() == 1);

   // deep, depth first in document order
   CHECK(Texts(root.One("author", true)) == Strings{ "Evelyn", "Nigel", "Herman" });
   CHECK(Texts(root.One("price", true)) == Strings{ "8.95", "12.99", "8", "19.95" });

   // non-deep does not look into sequences
   CHECK(root.One("store").One("books").One("author").Empty());

   // a key absent everywhere yields nothing, deep or not
   CHECK(root.One("nope", true).Empty());
}

TEST_CASE("Selection - All")
{
   Selection root(YAML::Load("{ a: 1, b: { c: 2, d: [ { e: 3 } ] } }"));

   CHECK(Texts(root.All()) == Strings{ "1", "{c: 2, d: [{e: 3}]}" });
   CHECK(root.All(true).Size() == 5);
   CHECK(Texts(root.All(true).I(Slice{ 2, std::nullopt, std::nullopt })) == Strings{ "2", "[{e: 3}]", "3" });

   Selection flat(YAML::Load("{ a: 1, b: 2 }"));
   CHECK(Texts(flat.All(true)) == Texts(flat.All()));
}

TEST_CASE("Selection - I")
{
   Selection items = Selection(YAML::Load("[a, b, c, d, e]")).Exp();
   REQUIRE(items.Size() == 5);

   CHECK(Texts(items.I(0)) == Strings{ "a" });
   CHECK(Texts(items.I(-1)) == Strings{ "e" });
   CHECK(items.I(5).Empty());
   CHECK(items.I(-6).Empty());
   CHECK(Texts(items.I({ 0, 2, 9, -1 })) == Strings{ "a", "c", "e" });
   CHECK(Texts(items.I(Slice{ 1, 3, std::nullopt })) == Strings{ "b", "c" });
   CHECK(Texts(items.I(Slice{ std::nullopt, std::nullopt, 2 })) == Strings{ "a", "c", "e" });
   CHECK(Texts(items.I(Slice{ -2, std::nullopt, std::nullopt })) == Strings{ "d", "e" });
   CHECK(Texts(items.I(Slice{ 10, 20, std::nullopt })) == Strings{});

   // reversing
   Strings reversed = Texts(items);
   std::reverse(reversed.begin(), reversed.end());
   CHECK(Texts(items.I(Slice{ std::nullopt, std::nullopt, -1 })) == reversed);
   CHECK(Texts(items.I(Slice{ 3, 0, -2 })) == Strings{ "d", "b" });

   // a root selection has one item: the root
   Selection root(YAML::Load("[1, 2]"));
   CHECK(root.I(0).Size() == 1);
   CHECK(root.I(0)[0].IsSequence());
   CHECK(root.I(1).Empty());

   // dynamic selectors
   auto sel = YAML::Load("{ one: 1, list: [0, 4], text: x, mixed: [0, x] }");
   CHECK(Texts(items.I(sel["one"])) == Strings{ "b" });
   CHECK(Texts(items.I(sel["list"])) == Strings{ "a", "e" });
   CHECK(ErrorOf([&] { items.I(sel["text"]); }) == EQueryError::InvalidSelectorType);
   CHECK(ErrorOf([&] { items.I(sel["mixed"]); }) == EQueryError::InvalidSelectorType);
   CHECK(ErrorOf([&] { items.I(Slice{ std::nullopt, std::nullopt, 0 }); }) == EQueryError::InvalidSelectorType);

   // the selector is checked even if there is nothing to select from
   CHECK(ErrorOf([&] { items.I(5).I(sel["text"]); }) == EQueryError::InvalidSelectorType);
}

TEST_CASE("Selection - El")
{
   Selection root(YAML::Load("{ a: [1, 2, 3], b: [4], c: scalar, d: { k: v } }"));
   auto values = root.All();

   CHECK(Texts(values.El(0)) == Strings{ "1", "4" });
   CHECK(Texts(values.El(-1)) == Strings{ "3", "4" });
   CHECK(Texts(values.El(Slice{ 1, std::nullopt, std::nullopt })) == Strings{ "2", "3" });
   CHECK(Texts(values.El({ 0, 2 })) == Strings{ "1", "3", "4" });
   CHECK(ErrorOf([&] { values.El(YAML::Load("x")); }) == EQueryError::InvalidSelectorType);
}

TEST_CASE("Selection - Exp")
{
   Selection root(YAML::Load("{ a: [1, 2], b: text, c: [], d: { k: v }, e: [[3]] }"));
   auto values = root.All();

   CHECK(Texts(values.Exp()) == Strings{ "1", "2", "[3]" });
   CHECK(values.Exp().Size() == 3);    // sum of the lengths of the index-iterable items
   CHECK(Texts(values.Exp().Exp()) == Strings{ "3" });
}

TEST_CASE("Selection - Filter")
{
   Selection books = Selection(YAML::Load(sampleBooks)).One("books", true).Exp();
   REQUIRE(books.Size() == 3);

   auto cheap = books.Filter([](size_t, Selection const & cur, Selection const &)
   {
      return cur.One("price")[0].as<double>() < 10;
   });
   CHECK(Texts(cheap.One("author")) == Strings{ "Evelyn", "Herman" });

   // index and root are passed
   auto second = books.Filter([](size_t idx, Selection const & cur, Selection const & root)
   {
      CHECK(root.Size() == 1);
      CHECK(root.One("name").Size() == 1);
      CHECK(cur.Size() == 1);
      return idx == 1;
   });
   CHECK(Texts(second.One("author")) == Strings{ "Nigel" });

   // exceptions reject the item
   auto withIsbn = books.Filter([](size_t, Selection const & cur, Selection const &)
   {
      return cur.One("isbn")[0].IsDefined();      // operator[] throws for items without isbn
   });
   CHECK(Texts(withIsbn.One("author")) == Strings{ "Herman" });

   CHECK(books.Filter([](size_t, Selection const &, Selection const &) -> bool { throw std::runtime_error("fail"); }).Empty());
   CHECK(books.Filter([](size_t, Selection const &, Selection const &) -> bool { throw 42; }).Empty());
   auto notFirst = books.Filter([](size_t idx, Selection const &, Selection const &) -> bool
   {
      if (idx == 0)
         throw "first";
      return true;
   });
   CHECK(Texts(notFirst.One("author")) == Strings{ "Nigel", "Herman" });
}

TEST_CASE("Selection - Call4*")
{
   Selection items = Selection(YAML::Load("[1, 2, x, 4]")).Exp();

   CHECK(items.Call4Item(1, [](Node const & n) { return n.as<int>(); }) == 2);
   CHECK_THROWS_AS(items.Call4Item(9, [](Node const & n) { return n.as<int>(); }), std::out_of_range);
   CHECK_THROWS_AS(items.Call4Item(2, [](Node const & n) { return n.as<int>(); }), YAML::Exception);

   CHECK(items.Call4Items([](Selection::Items const & all, size_t extra) { return all.size() + extra; }, 10) == 14);
   CHECK_THROWS_AS(items.Call4Items([](Selection::Items const &) -> int { throw std::runtime_error("fail"); }), std::runtime_error);

   CHECK(items.Call4Self([](Selection const & s, long long idx) { return s.I(idx); }, -1).Size() == 1);
   CHECK_THROWS_AS(items.Call4Self([](Selection const &) -> int { throw std::logic_error("fail"); }), std::logic_error);

   // whatever the functor throws, only that item is dropped
   auto nonStd = items.Call4Each([](Node const & n) -> int
   {
      if (n.Scalar() == "2")
         throw 42;
      return n.as<int>();
   });
   CHECK(Texts(nonStd) == Strings{ "1", "4" });

   // the item that cannot be converted is skipped
   auto doubled = items.Call4Each([](Node const & n, int factor) { return n.as<int>() * factor; }, 2);
   CHECK(Texts(doubled) == Strings{ "2", "4", "8" });
   CHECK(doubled.SharesRoot(items));
}

TEST_CASE("Selection - composition and views")
{
   Selection root(YAML::Load("{ a: [1, 2], b: [3] }"));
   auto a = root.One("a").Exp();
   auto b = root.One("b").Exp();

   CHECK(Texts(a + b) == Strings{ "1", "2", "3" });
   CHECK(Texts(a * 2) == Strings{ "1", "2", "1", "2" });
   CHECK(Texts(2 * b) == Strings{ "3", "3" });
   CHECK((a * 0).Empty());
   CHECK(Texts(a + b.Tuple()) == Strings{ "1", "2", "3" });

   CHECK(a.Size() == 2);
   CHECK(a[0].Scalar() == "1");
   CHECK(a[-1].Scalar() == "2");
   CHECK_THROWS_AS(a[2], std::out_of_range);
   CHECK_THROWS_AS(a[-3], std::out_of_range);
   CHECK(a.Tuple().size() == 2);

   CHECK(a.ToString() == "[1, 2]");
   std::stringstream str;
   str << b;
   CHECK(str.str() == "[3]");
   std::stringstream printed;
   b.Print(printed);
   CHECK(printed.str() == "[3]\n");
   b.Print();

   // operators don't change the receiver
   auto before = Texts(a);
   a.I(0);
   a.Exp();
   CHECK(Texts(a) == before);

   // assignment replaces the item list, the tree is not touched
   Selection c = a;
   c = b;
   CHECK(Texts(c) == Strings{ "3" });
   CHECK(Texts(root.One("a").Exp()) == Strings{ "1", "2" });
}

TEST_CASE("Selection - metadata")
{
   auto config = ClassifierConfig::Default();
   config.maxDepth = 42;
   Node tree = YAML::Load("{ a: { b: 1 } }");
   Selection root(tree, config);

   auto b = root.One("a").One("b");
   CHECK(b.SharesRoot(root));
   CHECK(b.Config().maxDepth == 42);
   CHECK(b.Root().Size() == 1);
   CHECK(b.Root()[0].IsMap());

   auto meta = b.Meta();
   CHECK(meta.config.maxDepth == 42);
   CHECK(meta.root.One("a").Size() == 1);

   auto other = b.Reroot(YAML::Load("[1]"));
   CHECK(!other.SharesRoot(root));
   CHECK(other.Config().maxDepth == 42);
}

TEST_CASE("Selection - recursion limit")
{
   std::string deep = "1";
   for (int i = 0; i < 20; ++i)
      deep = "{ a: " + deep + " }";

   auto config = ClassifierConfig::Default();
   config.maxDepth = 5;
   Selection root(YAML::Load(deep), config);
   CHECK(ErrorOf([&] { root.One("a", true); }) == EQueryError::RecursionLimitExceeded);
   CHECK(root.One("a").Size() == 1);

   Selection unlimited(YAML::Load(deep));
   CHECK(unlimited.One("a", true).Size() == 20);
}


// ---- lexer
TEST_CASE("Internal: Lexer")
{
   using namespace YamlSelectDetail;

   {
      Lexer lex(R"($.."a b"[0, -1]  .[1:2] @* != <= >= < > = | ( ) + / %)");
      CHECK(lex.NextToken().id == EToken::Root);
      CHECK(lex.NextToken().id == EToken::DoublePeriod);
      CHECK(lex.NextToken().id == EToken::String);
      CHECK(lex.Token().value == "a b");
      CHECK(lex.NextToken().id == EToken::OpenBracket);
      CHECK(lex.NextToken().id == EToken::Integer);
      CHECK(lex.NextToken().id == EToken::Comma);
      CHECK(lex.NextToken().id == EToken::Minus);
      CHECK(lex.NextToken().id == EToken::Integer);
      CHECK(lex.Token().integer == 1);
      CHECK(lex.NextToken().id == EToken::CloseBracket);
      CHECK(lex.NextToken().id == EToken::Period);
      CHECK(lex.NextToken().id == EToken::OpenBracket);
      CHECK(lex.NextToken().id == EToken::Integer);
      CHECK(lex.NextToken().id == EToken::Colon);
      CHECK(lex.NextToken().id == EToken::Integer);
      CHECK(lex.NextToken().id == EToken::CloseBracket);
      CHECK(lex.NextToken().id == EToken::Current);
      CHECK(lex.NextToken().id == EToken::Asterisk);
      CHECK(lex.NextToken().id == EToken::NotEqual);
      CHECK(lex.NextToken().id == EToken::LessEqual);
      CHECK(lex.NextToken().id == EToken::GreaterEqual);
      CHECK(lex.NextToken().id == EToken::Less);
      CHECK(lex.NextToken().id == EToken::Greater);
      CHECK(lex.NextToken().id == EToken::Equal);
      CHECK(lex.NextToken().id == EToken::Pipe);
      CHECK(lex.NextToken().id == EToken::OpenParen);
      CHECK(lex.NextToken().id == EToken::CloseParen);
      CHECK(lex.NextToken().id == EToken::Plus);
      CHECK(lex.NextToken().id == EToken::Slash);
      CHECK(lex.NextToken().id == EToken::Percent);
      CHECK(lex.NextToken().id == EToken::None);
      CHECK(lex.NextToken().id == EToken::None);     // stays at the end
   }

   {
      Lexer lex("1.5 .5 2e3 42 AND Or TRUE false Null startswith");
      CHECK(lex.NextToken().id == EToken::Float);
      CHECK(lex.Token().number == 1.5);
      CHECK(lex.NextToken().id == EToken::Float);
      CHECK(lex.Token().number == 0.5);
      CHECK(lex.NextToken().id == EToken::Float);
      CHECK(lex.Token().number == 2000);
      CHECK(lex.NextToken().id == EToken::Integer);
      CHECK(lex.Token().integer == 42);
      CHECK(lex.NextToken().id == EToken::And);
      CHECK(lex.NextToken().id == EToken::Or);
      CHECK(lex.NextToken().id == EToken::True);
      CHECK(lex.NextToken().id == EToken::False);
      CHECK(lex.NextToken().id == EToken::Null);
      CHECK(lex.NextToken().id == EToken::Identifier);
      CHECK(lex.Token().text == "startswith");
   }

   {
      Lexer lex(R"("q\"b\\s\/\nä😀")");
      CHECK(lex.NextToken().id == EToken::String);
      CHECK(lex.Token().value == u8"q\"b\\s/\nä\U0001F600");
   }

   {
      Lexer lex(R"("\u00e4\ud83d\ude00\t")");
      CHECK(lex.NextToken().id == EToken::String);
      CHECK(lex.Token().value == u8"\u00e4\U0001F600\t");
   }

   {
      Lexer lex("$\n  .\"a\"");
      lex.NextToken();
      auto const & t = lex.NextToken();
      CHECK(t.id == EToken::Period);
      CHECK(t.offset == 4);
      CHECK(t.line == 2);
      CHECK(t.column == 3);
   }
}

TEST_CASE("Internal: Lexer errors")
{
   using namespace YamlSelectDetail;

   auto Check = [](PathArg query, size_t offset, size_t line, size_t column)
   {
      try
      {
         Lexer(query).Tokenize();
         FAIL("expected a lex error");
      }
      catch (QueryException const & x)
      {
         CHECK(x.Error() == EQueryError::LexError);
         CHECK(x.ErrorOffset() == offset);
         CHECK(x.Line() == line);
         CHECK(x.Column() == column);
      }
   };

   Check(R"($."abc)", 2, 1, 3);
   Check("$.\"a\\qb\"", 4, 1, 5);
   Check("$ # ", 2, 1, 3);
   Check("$\n\n  ~", 5, 3, 3);
   Check("@ ! 1", 2, 1, 3);
   Check("99999999999999999999", 0, 1, 1);
   Check(R"("\u12")", 1, 1, 2);
}


// ---- parser
namespace
{
   std::string DumpQuery(PathArg query)
   {
      return PathQuery().Compile(query).Dump();
   }

   QueryException ParseError(PathArg query)
   {
      try
      {
         PathQuery().Compile(query);
      }
      catch (QueryException const & x)
      {
         return x;
      }
      FAIL("expected a parse error: " + std::string(query));
      return QueryException();
   }
}

TEST_CASE("Parser - paths")
{
   CHECK(DumpQuery("$") == "$");
   CHECK(DumpQuery("@") == "@");
   CHECK(DumpQuery(R"($."a"."b")") == R"($.one("a").one("b"))");
   CHECK(DumpQuery(R"($.."a")") == R"($.one("a", deep))");
   CHECK(DumpQuery("$.*..*") == "$.all().all(deep)");
   CHECK(DumpQuery("$[0][-1][0,2][1:][:-1][::2][1:5:-1][:]") == "$.i(0).i(-1).i([0,2]).i(1:).i(:-1).i(::2).i(1:5:-1).i(:)");
   CHECK(DumpQuery("$.[0].[1, 2].[::-1]") == "$.el(0).el([1,2]).el(::-1)");
   CHECK(DumpQuery("$[*]") == "$.exp()");
   CHECK(DumpQuery(R"($."a" | @."b"[0])") == R"($.one("a") | @.one("b").i(0))");
   CHECK(DumpQuery("$\n  .\"a\"\n  [0]") == R"($.one("a").i(0))");
}

TEST_CASE("Parser - filters")
{
   CHECK(DumpQuery(R"($[@."x" = 1])") == R"($.filter((@.one("x") = 1)))");
   CHECK(DumpQuery(R"($[@."x"])") == R"($.filter(@.one("x")))");
   CHECK(DumpQuery(R"($[1 + 2 * 3 - 4])") == "$.filter(((1 + (2 * 3)) - 4))");
   CHECK(DumpQuery(R"($[(1 + 2) * 3])") == "$.filter(((1 + 2) * 3))");
   CHECK(DumpQuery(R"($[-@."a" % 2 = 1])") == R"($.filter(((-@.one("a") % 2) = 1)))");
   CHECK(DumpQuery(R"($[@."a" or @."b" and @."c"])") == R"($.filter((@.one("a") or (@.one("b") and @.one("c")))))");
   CHECK(DumpQuery(R"($[@."a" < 1 AND @."b" >= 2.5])") == R"($.filter(((@.one("a") < 1) and (@.one("b") >= 2.5))))");
   CHECK(DumpQuery(R"($[@."s" != "x\"y" or null = TRUE])") == R"($.filter(((@.one("s") != "x\"y") or (null = true))))");
   CHECK(DumpQuery(R"($[startswith(@."a", "E")])") == R"($.filter(startswith(@.one("a"), "E")))");
   CHECK(DumpQuery(R"($[count()])") == "$.filter(count())");
   CHECK(DumpQuery(R"($[@[@."i" = $."n"]])") == R"($.filter(@.filter((@.one("i") = $.one("n")))))");
   CHECK(DumpQuery(R"(count($.."a"))") == R"(@.call4self(count($.one("a", deep))))");
   CHECK(DumpQuery(R"($[1.5])") == "$.filter(1.5)");
}

TEST_CASE("Parser - errors")
{
   {
      auto x = ParseError("");
      CHECK(x.Error() == EQueryError::UnexpectedEnd);
      CHECK(x.ErrorOffset() == 0);
   }

   {
      auto x = ParseError(R"($."a" "b")");
      CHECK(x.Error() == EQueryError::SyntaxError);
      CHECK(x.ErrorOffset() == 6);
      CHECK(x.ValidQuery() == R"($."a" )");
      CHECK(x.FullQuery() == R"($."a" "b")");
   }

   CHECK(ParseError("a").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$.").Error() == EQueryError::UnexpectedEnd);
   CHECK(ParseError("$.a").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$..[0]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[0").Error() == EQueryError::UnexpectedEnd);
   CHECK(ParseError("$[0,]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[1, \"a\"]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$.[\"a\"]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$.[1.5]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[1:2.5]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[(1]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[1 < 2 < 3]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[f(1,)]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[f]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$]").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$ $").Error() == EQueryError::SyntaxError);
   CHECK(ParseError("$[\"a").Error() == EQueryError::LexError);

   {
      auto x = ParseError("$\n[1 +]");
      CHECK(x.Error() == EQueryError::SyntaxError);
      CHECK(x.Line() == 2);
      CHECK(x.Column() == 5);
      CHECK(x.IsParseError());
      CHECK(!x.IsEvalError());
      CHECK(x.What(false).find("syntax error") == 0);
      CHECK(x.What(true).find("line 2, column 5") != std::string::npos);
   }

   {
      std::string nested = "$";
      for (int i = 0; i < 300; ++i)
         nested = "$[" + nested + "]";
      CHECK(ParseError(nested).Error() == EQueryError::SyntaxError);
   }
}

TEST_CASE("QueryValidate")
{
   CHECK(QueryValidate("$") == EQueryError::OK);
   CHECK(QueryValidate(R"($.."a"[@."b" > 2])") == EQueryError::OK);
   CHECK(QueryValidate(R"(startswith(@, "x"))") == EQueryError::OK);
   CHECK(QueryValidate(R"($[nosuchfunction(@)])") == EQueryError::OK);   // functions are resolved at evaluation

   std::string valid;
   size_t offset = 0;
   CHECK(QueryValidate(R"($."a"[0,x])", &valid, &offset) == EQueryError::SyntaxError);
   CHECK(offset == 7);
   CHECK(valid == R"($."a"[0)");

   CHECK(QueryValidate("$[", &valid, &offset) == EQueryError::UnexpectedEnd);
   CHECK(QueryValidate("$ ~", &valid, &offset) == EQueryError::LexError);
   CHECK(offset == 2);
}


// ---- evaluator
TEST_CASE("PathQuery - paths")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));

   CHECK(Texts(query(R"($.."author")", root)) == Texts(root.One("author", true)));
   CHECK(Texts(query(R"(@."name")", root)) == Strings{ "shop" });
   CHECK(Texts(query(R"($."store"."books"[*]."title")", root)) == Strings{ "Sayings", "Sword", "Moby Dick" });
   CHECK(Texts(query(R"($."store"."books".[1]."author")", root)) == Strings{ "Nigel" });
   CHECK(Texts(query(R"($."store"."books".[-1:]."author")", root)) == Strings{ "Herman" });
   CHECK(Texts(query(R"($.."books"[*]."author"[0, 2])", root)) == Strings{ "Evelyn", "Herman" });
   CHECK(Texts(query(R"($.."books"[*]."author"[::-1])", root)) == Strings{ "Herman", "Nigel", "Evelyn" });
   CHECK(Texts(query(R"($."name" | $.."color")", root)) == Strings{ "shop", "red" });
   CHECK(Texts(query(R"($."store"."bicycle".*)", root)) == Strings{ "red", "19.95" });
   CHECK(query(R"($."nope"."deeper")", root).Empty());
   CHECK(query(R"($[5])", root).Empty());

   // $[0] selects from the item list, not from the root's content
   auto first = query("$[0]", root);
   REQUIRE(first.Size() == 1);
   CHECK(first[0].IsMap());
   CHECK(first.SharesRoot(root));

   // a query evaluated on a derived selection
   auto books = query(R"($.."books"[*])", root);
   CHECK(Texts(query(R"(@."price")", books)) == Strings{ "8.95", "12.99", "8" });
}

TEST_CASE("PathQuery - filters")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));
   auto Authors = [&](PathArg filter)
   {
      return Texts(query(std::string(R"($.."books"[*][)") + std::string(filter) + R"(]."author")", root));
   };

   CHECK(Authors(R"(@."price" < 10)") == Strings{ "Evelyn", "Herman" });
   CHECK(Authors(R"(@."price" >= 8.95 and @."price" < 12)") == Strings{ "Evelyn" });
   CHECK(Authors(R"(@."price" = 8)") == Strings{ "Herman" });
   CHECK(Authors(R"(@."price" * 2 > 20)") == Strings{ "Nigel" });
   CHECK(Authors(R"(-@."price" < -10)") == Strings{ "Nigel" });
   CHECK(Authors(R"(@."author" = "Nigel" or @."author" = "Evelyn")") == Strings{ "Evelyn", "Nigel" });
   CHECK(Authors(R"(@."author" > "H")") == Strings{ "Nigel", "Herman" });

   // existence tests
   CHECK(Authors(R"(@."isbn")") == Strings{ "Herman" });
   CHECK(Authors(R"(@."isbn" or @."price" > 10)") == Strings{ "Nigel", "Herman" });
   CHECK(Authors(R"(@."tags")") == Strings{ "Evelyn", "Nigel", "Herman" });
   CHECK(Authors(R"(@."tags"[*])") == Strings{ "Evelyn", "Nigel" });
   CHECK(Authors(R"(@."tags"[@[*]])") == Strings{ "Evelyn", "Nigel" });

   // a comparison with a missing operand rejects the item
   CHECK(Authors(R"(@."isbn" != "x")") == Strings{ "Herman" });

   // a type mismatch rejects the item
   CHECK(Authors(R"(@."author" < 10)") == Strings{});
   CHECK(Authors(R"(@."price" / 0 > 1)") == Strings{});

   // literals in boolean context
   CHECK(Authors("true").size() == 3);
   CHECK(Authors("(0)").empty());
   CHECK(Authors(R"("")").empty());
   CHECK(Authors("null").empty());

   // $ inside a filter is the root of the tree
   CHECK(Authors(R"($."name" = "shop")").size() == 3);
   CHECK(Authors(R"(@."price" < $.."bicycle"."price" - 10)") == Strings{ "Evelyn", "Herman" });

   // nested filter
   CHECK(Authors(R"(@."tags"[*][@ = "fiction"])") == Strings{ "Nigel" });
}

TEST_CASE("PathQuery - $ and @ at the top level")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));
   auto books = root.One("books", true).Exp();

   // both refer to the selection passed in
   CHECK(query("$", books).Size() == 3);
   CHECK(query("@", books).Size() == 3);
   CHECK(Texts(query(R"($."price")", books)) == Strings{ "8.95", "12.99", "8" });

   // inside a filter, $ is the root of the tree
   CHECK(query(R"(@[$."name" = "shop"])", books).Size() == 3);
   CHECK(query(R"(@[$."price"])", books).Empty());
}

TEST_CASE("PathQuery - custom classifier configuration")
{
   PathQuery query;
   auto config = ClassifierConfig::Default();
   config.iterableByKey.insert(ShapeTag::Sequence);
   Selection root(YAML::Load("{ list: [a, b, c], nested: [[x, y]] }"), config);

   CHECK(Texts(query(R"($."list"."1")", root)) == Strings{ "b" });
   CHECK(Texts(query(R"($."list".*)", root)) == Strings{ "a", "b", "c" });
   CHECK(Texts(query(R"($.."0")", root)) == Strings{ "a", "[x, y]", "x" });

   // the default configuration does not look up keys in sequences
   Selection plain(YAML::Load("{ list: [a, b, c] }"));
   CHECK(query(R"($."list"."1")", plain).Empty());
}

TEST_CASE("PathQuery - recursion limit")
{
   PathQuery query;
   std::string deep = "1";
   for (int i = 0; i < 20; ++i)
      deep = "{ a: " + deep + " }";

   auto config = ClassifierConfig::Default();
   config.maxDepth = 5;
   CHECK(ErrorOf([&] { query(R"($.."a")", Selection(YAML::Load(deep), config)); }) == EQueryError::RecursionLimitExceeded);

   // inside a filter, exceeding the limit rejects the item
   config.maxDepth = 1;
   CHECK(query("$[@[@[true]]]", Selection(YAML::Load("[1]"), config)).Empty());
   CHECK(query("$[@[@[true]]]", Selection(YAML::Load("[1]"))).Size() == 1);
}

TEST_CASE("PathQuery - Test and Call")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));
   auto books = root.One("books", true).Exp();
   auto nigel = books.I(1);

   CHECK(query.Test(R"(@."price" > 10)", nigel, root));
   CHECK(!query.Test(R"(@."price" > 10 and $."name" = "bike")", nigel, root));
   CHECK(!query.Test(R"(@."isbn" = "x")", nigel, root));
   CHECK(ErrorOf([&] { query.Test(R"(@."price" >)", nigel, root); }) == EQueryError::UnexpectedEnd);
   CHECK(ErrorOf([&] { query.Test(R"(@."author" < 1)", nigel, root); }) == EQueryError::TypeMismatch);

   CHECK(Text(query.Call("count()", books, root)) == "3");
   CHECK(Text(query.Call(R"(upper(@."author"))", nigel, root)) == "NIGEL");
   CHECK(ErrorOf([&] { query.Call(R"($."name")", books, root); }) == EQueryError::SyntaxError);
   CHECK(ErrorOf([&] { query.Call(R"(upper(@."isbn"))", nigel, root); }) == EQueryError::InvalidArgument);
   CHECK(ErrorOf([&] { query.Call(R"(startswith(@."author", $."nope"))", nigel, root); }) == EQueryError::InvalidArgument);
}

TEST_CASE("PathQuery - compiled queries")
{
   PathQuery query;
   auto authors = query.Compile(R"($.."author")");
   CHECK(authors.Text() == R"($.."author")");
   CHECK(authors.Dump() == R"($.one("author", deep))");

   Selection a(YAML::Load("{ x: { author: A } }"));
   Selection b(YAML::Load("[ { author: B }, { author: C } ]"));
   CHECK(Texts(authors.Evaluate(a)) == Strings{ "A" });
   CHECK(Texts(authors.Evaluate(b)) == Strings{ "B", "C" });

   // evaluation errors carry the query text
   auto bad = query.Compile(R"(toint("x"))");
   try
   {
      bad.Evaluate(a);
      FAIL("expected an evaluation error");
   }
   catch (QueryException const & x)
   {
      CHECK(x.Error() == EQueryError::InvalidArgument);
      CHECK(x.IsEvalError());
      CHECK(x.FullQuery() == R"(toint("x"))");
      CHECK(x.What(true).find(R"(query: toint("x"))") != std::string::npos);
   }

   // free functions
   CHECK(Texts(Select(YAML::Load("{ k: v }"), R"($."k")")) == Strings{ "v" });
   CHECK(Texts(Select(b, R"(@[*]."author")")) == Strings{ "B", "C" });
   CHECK(Texts(Select(b.Exp(), R"(@."author")")) == Strings{ "B", "C" });
}

TEST_CASE("PathQuery - top level function calls")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));

   auto count = query(R"(count($.."author"))", root);
   REQUIRE(count.Size() == 1);
   CHECK(count[0].Scalar() == "3");
   CHECK(count.SharesRoot(root));

   CHECK(Texts(query(R"(concat($.."color", "blue"))", root)) == Strings{ "[red, blue]" });
   CHECK(Texts(query(R"(startswith(@."name", "sh"))", root)) == Strings{ "true" });
   CHECK(query(R"(startswith(@."name", $."nope"))", root).Empty());
}


// ---- functions
TEST_CASE("FunctionRegistry")
{
   auto const & builtins = FunctionRegistry::Builtins();
   CHECK(builtins.Contains("startswith"));
   CHECK(!builtins.Contains("StartsWith"));
   CHECK(builtins.Size() == builtins.Names().size());

   Selection root(YAML::Load("{ n: 21 }"));

   FunctionRegistry reg = builtins;
   reg.Register("twice", [](Selection const & first, std::vector<Node> const &)
   {
      return YamlSelectDetail::MakeInt(YamlSelectDetail::AsInt(first[0]) * 2);
   });
   reg.Register("len", [](Selection const &, std::vector<Node> const &) { return YamlSelectDetail::MakeInt(99); });
   reg.Register("boom", [](Selection const &, std::vector<Node> const &) -> Node { throw std::runtime_error("boom"); });

   PathQuery custom(reg);
   CHECK(Text(custom.Call(R"(twice($."n"))", root, root)) == "42");
   CHECK(Texts(custom(R"($[twice(@."n") = 42]."n")", root)) == Strings{ "21" });

   // replaced function, the builtin table is not changed
   CHECK(Text(custom.Call(R"(len("abc"))", root, root)) == "99");
   CHECK(Text(PathQuery().Call(R"(len("abc"))", root, root)) == "3");

   // failing functions
   CHECK(ErrorOf([&] { custom.Call("boom()", root, root); }) == EQueryError::FunctionFailed);
   CHECK(custom(R"($[boom()])", root).Empty());

   // unknown functions are reported, even inside a filter
   CHECK(reg.Remove("twice"));
   CHECK(!reg.Remove("twice"));
   CHECK(ErrorOf([&] { reg.Call("twice", root, {}); }) == EQueryError::UnknownFunction);
   CHECK(ErrorOf([&] { PathQuery(reg)(R"($[twice(@."n") = 42])", root); }) == EQueryError::UnknownFunction);
   CHECK(ErrorOf([&] { PathQuery()(R"($[@."n" or nosuchfunction()])", root); }) == EQueryError::UnknownFunction);

   // the table is copied by PathQuery
   CHECK(custom.Functions().Contains("twice"));
}

namespace
{
   Selection const & FunctionSample()
   {
      static Selection const sample(YAML::Load(R"({ list: [1, 2, 3], text: "  Mixed  case  text ", empty: [] })"));
      return sample;
   }

   std::string Eval(PathArg call)
   {
      return Text(PathQuery().Call(call, FunctionSample(), FunctionSample()));
   }

   EQueryError EvalError(PathArg call)
   {
      return ErrorOf([&] { Eval(call); });
   }
}

TEST_CASE("Builtins - conversion")
{
   using namespace YamlSelectDetail;

   CHECK(Eval(R"(toint("42"))") == "42");
   CHECK(Eval(R"(toint(" +7 "))") == "7");
   CHECK(Eval("toint(3.9)") == "3");
   CHECK(Eval("toint(-3.9)") == "-3");
   CHECK(Eval("toint(true)") == "1");
   CHECK(EvalError(R"(toint("x"))") == EQueryError::InvalidArgument);
   CHECK(EvalError(R"(toint($."list"))") == EQueryError::InvalidArgument);
   CHECK(EvalError("toint(1e300)") == EQueryError::InvalidArgument);
   CHECK(EvalError("toint(-1e19)") == EQueryError::InvalidArgument);
   CHECK(Eval("toint(-9.2e18)") == "-9200000000000000000");

   CHECK(Eval(R"(toflt("1.5"))") == "1.5");
   CHECK(Eval("toflt(2)") == "2.0");
   CHECK(EvalError(R"(toflt("1.5x"))") == EQueryError::InvalidArgument);

   CHECK(Eval("tostr(12)") == "12");
   CHECK(KindOf(PathQuery().Call("tostr(12)", FunctionSample(), FunctionSample())) == EValueKind::String);
   CHECK(Eval("tostr(1.0)") == "1.0");
   CHECK(Eval("tostr(true)") == "true");
   CHECK(Eval("tostr(null)") == "null");
   CHECK(Eval(R"(tostr($."list"))") == "[1, 2, 3]");

   CHECK(Eval(R"(get($."list"[*], 0))") == "1");
   CHECK(Eval(R"(get($."list"[*], -1))") == "3");
   CHECK(EvalError(R"(get($."list"[*], 3))") == EQueryError::InvalidArgument);
   CHECK(EvalError(R"(get($."list"[*], "a"))") == EQueryError::InvalidArgument);

   CHECK(Eval(R"(len("äb"))") == "2");
   CHECK(Eval(R"(len($."list"))") == "3");
   CHECK(Eval(R"(len($))") == "3");
   CHECK(EvalError("len(5)") == EQueryError::InvalidArgument);
   CHECK(EvalError(R"(len($."nope"))") == EQueryError::InvalidArgument);
   CHECK(EvalError(R"(len("a", "b"))") == EQueryError::InvalidArgument);
}

TEST_CASE("Builtins - type tests")
{
   CHECK(Eval("isnum(1)") == "true");
   CHECK(Eval("isnum(1.5)") == "true");
   CHECK(Eval("isnum(true)") == "false");
   CHECK(Eval(R"(isnum("1"))") == "false");
   CHECK(Eval("isint(1.5)") == "false");
   CHECK(Eval("isflt(1.5)") == "true");
   CHECK(Eval("isbool(false)") == "true");
   CHECK(Eval(R"(isstr("a"))") == "true");
   CHECK(Eval("isnull(null)") == "true");
   CHECK(Eval(R"(isarr($."list"))") == "true");
   CHECK(Eval(R"(isarr($."text"))") == "false");
   CHECK(Eval("isobj($)") == "true");
}

TEST_CASE("Builtins - numbers and slices")
{
   CHECK(Eval("rnd(2.5)") == "2");
   CHECK(Eval("rnd(3.5)") == "4");
   CHECK(Eval("rnd(3.14159, 2)") == "3.14");
   CHECK(Eval("rnd(1250, -2)") == "1200");
   CHECK(Eval("rnd(7)") == "7");
   CHECK(EvalError(R"(rnd("1"))") == EQueryError::InvalidArgument);
   CHECK(EvalError("rnd(1e300)") == EQueryError::InvalidArgument);
   CHECK(Eval("rnd(5, -400)") == "0");
   CHECK(Eval("rnd(1.5, 400)") == "1.5");
   CHECK(Eval("rnd(1.5, -400)") == "0.0");

   PathQuery query;
   Selection huge(YAML::Load("[ { a: 1e300 }, { a: 2.5 } ]"));
   CHECK(Texts(query(R"($[*][toint(@."a") > 0]."a")", huge)) == Strings{ "2.5" });
   CHECK(Texts(query(R"($[*][rnd(@."a") > 0]."a")", huge)) == Strings{ "2.5" });

   CHECK(Eval(R"(slice("abcdef", 1, 4))") == "bcd");
   CHECK(Eval(R"(slice("abc", null, null, -1))") == "cba");
   CHECK(Eval(R"(slice("äöü", -2))") == u8"öü");
   CHECK(Eval(R"(slice($."list", 1))") == "[2, 3]");
   CHECK(EvalError(R"(slice("abc", 0, 1, 0))") == EQueryError::InvalidSelectorType);
   CHECK(EvalError("slice(1, 0)") == EQueryError::InvalidArgument);

   CHECK(Eval(R"(replace("a-b-c", "-", "+"))") == "a+b+c");
   CHECK(Eval(R"(replace("ab", "", "|"))") == "|a|b|");
   CHECK(Eval(R"(replace("aaa", "aa", "b"))") == "ba");
}

TEST_CASE("Builtins - strings")
{
   CHECK(Eval(R"(isdigit("123"))") == "true");
   CHECK(Eval(R"(isdigit(""))") == "false");
   CHECK(Eval(R"(isalpha("ab1"))") == "false");
   CHECK(Eval(R"(isalnum("ab1"))") == "true");
   CHECK(Eval(R"(isspace(" \t"))") == "true");
   CHECK(Eval(R"(islower("abc1"))") == "true");
   CHECK(Eval(R"(isupper("ABC"))") == "true");
   CHECK(Eval(R"(isupper("AbC"))") == "false");
   CHECK(Eval(R"(istitle("Hello World"))") == "true");
   CHECK(Eval(R"(istitle("Hello world"))") == "false");
   CHECK(EvalError("isdigit(1)") == EQueryError::InvalidArgument);

   CHECK(Eval(R"(lower("AbC"))") == "abc");
   CHECK(Eval(R"(upper("AbC"))") == "ABC");
   CHECK(Eval(R"(capitalize("hELLO wORLD"))") == "Hello world");
   CHECK(Eval(R"(title("hello wORLD"))") == "Hello World");
   CHECK(Eval(R"(ltrim("  a "))") == "a ");
   CHECK(Eval(R"(rtrim("  a "))") == "  a");
   CHECK(Eval(R"(trim($."text"))") == "Mixed  case  text");
   CHECK(Eval(R"(normalize($."text"))") == "Mixed case text");

   CHECK(Eval(R"(startswith("hello", "he"))") == "true");
   CHECK(Eval(R"(startswith("he", "hello"))") == "false");
   CHECK(Eval(R"(endswith("hello", "lo"))") == "true");
   CHECK(Eval(R"(instr("hello", "ell"))") == "true");
   CHECK(EvalError(R"(startswith("hello"))") == EQueryError::InvalidArgument);
}

TEST_CASE("Builtins - selections")
{
   CHECK(Eval(R"(count($."list"[*]))") == "3");
   CHECK(Eval(R"(count($."nope"))") == "0");
   CHECK(Eval(R"(all($."list"[*]))") == "true");
   CHECK(Eval(R"(all($."nope"))") == "false");
   CHECK(Eval(R"(any($."empty" | $."list"[0]))") == "true");
   CHECK(Eval(R"(any($."empty"))") == "false");
   CHECK(Eval(R"(has($."nope"))") == "false");
   CHECK(Eval(R"(no($."nope"))") == "true");

   CHECK(Eval(R"(inval("hello", "ell"))") == "true");
   CHECK(Eval(R"(inval($."list", 2.0))") == "true");
   CHECK(Eval(R"(inval($."list", 5))") == "false");
   CHECK(Eval(R"(inval($, "list"))") == "true");
   CHECK(Eval(R"(initems($."list"[*], 3))") == "true");
   CHECK(Eval(R"(initems($."list"[*], "3"))") == "false");

   CHECK(Eval(R"(concat($."list"[*], 4))") == "[1, 2, 3, 4]");
   CHECK(Eval("concat(1)") == "[1]");
}

TEST_CASE("Builtins - in filters")
{
   PathQuery query;
   Selection root(YAML::Load(sampleBooks));

   CHECK(Texts(query(R"($.."author"[startswith(@, "E")])", root)) == Strings{ "Evelyn" });
   CHECK(Texts(query(R"($.."author"[len() = 6])", root)) == Strings{ "Evelyn", "Herman" });
   CHECK(Texts(query(R"($.."books"[*][count(@."tags"[*]) = 2]."author")", root)) == Strings{ "Evelyn" });
   CHECK(Texts(query(R"($.."books"[*][len(@."title") > 5]."author")", root)) == Strings{ "Evelyn", "Herman" });
   CHECK(Texts(query(R"($.."books"[*][inval(@."tags", "fiction")]."title")", root)) == Strings{ "Sword" });
   CHECK(Texts(query(R"($.."books"[*][lower(@."author") = "nigel"]."price")", root)) == Strings{ "12.99" });
   CHECK(Texts(query(R"($.."books"[*][isstr(@."isbn")]."author")", root)) == Strings{ "Herman" });
   CHECK(Texts(query(R"($.."books"[*][no(@."isbn")]."author")", root)) == Strings{ "Evelyn", "Nigel" });
}


// ---- command line

bool is(char const * a, char const * b) { return strcasecmp(a, b) == 0; }
bool is(char const * a, char const * b, char const * balt) { return is(a,b) || (balt && is(a,balt)); }

int main(int argc, char ** argv)
{
   auto is_ = [&](int argidx, char const * b, char const * balt = nullptr)
   {
      return argc > argidx && is(argv[argidx], b, balt);
   };

   if (is_(1, "--runtests", "-r"))
      return doctest::Context(argc-1, argv+1).run();

   if (argc == 1 || (argc == 2 && is_(1, "--help", "-h")))
   {
      std::cout << R"(Options:
 --runtest, -r   (must be first) Run unit tests. all following arguments are passed to doctest.

 --help, -h      (must be the only argument) show this help

 <YAMLFile> <query> [-v|--verbose] [<command>]

   Run a query against the specified YAML

   YAMLFile can be:

                  a path to a YAML file,
       *          for the embedded YAML sample,
       *<yaml>    where <yaml> is a raw YAML string

   <query> is a PathQuery, e.g. $.."author"[startswith(@, "E")]

   -v to enable verbose output, with evaluation trace and error details

   <command> is the command to run
     Select or S (default)
     Test or T         evaluate <query> as filter expression for the root
     Dump or D         show the parsed query
     Validate or V
)";
      return 0;
   }

   if (argc >= 2 && argc <= 5)
   {
      const bool verbose = is_(3, "--verbose", "-v");
      if (verbose)
         spdlog::set_level(spdlog::level::trace);

      try
      {
         YAML::Node root;
         char const * sroot = argv[1];

         if (*sroot == '*')
         {
            ++sroot;
            root = YAML::Load(*sroot ? sroot : sampleBooks);
         }
         else
            root = YAML::LoadFile(sroot);

         char const * query = "";
         if (argc >= 3)
            query = argv[2];

         int cmdidx = verbose ? 4 : 3;
         Selection rootSel(root);
         if (is_(cmdidx, "S", "Select") || argc <= cmdidx || is_(cmdidx, ""))    // Select
         {
            auto result = PathQuery().Select(query, rootSel);
            for (auto && item : result)
               std::cout << "- " << Text(item) << "\n";
         }
         else if (is_(cmdidx, "T", "Test"))
         {
            std::cout << (PathQuery().Test(query, rootSel, rootSel) ? "true" : "false") << "\n";
         }
         else if (is_(cmdidx, "D", "Dump"))
         {
            std::cout << PathQuery().Compile(query).Dump() << "\n";
         }
         else if (is_(cmdidx, "V", "Validate"))
         {
            std::string valid;
            size_t erroffs = 0;
            auto result = QueryValidate(query, &valid, &erroffs);

            std::cout << "---\n" << QueryException::GetErrorMessage(result) << "\n"
               << "valid query: " << valid << "\n"
               << "error offset: " << erroffs << "\n";
         }
         else
            throw std::invalid_argument("unknown command");
      }
      catch (QueryException const & x)
      {
         std::cout << "---\nERROR: " << x.What(verbose) << "\n";
         return 1;
      }
      catch (std::exception const & x)
      {
         std::cout << "---\nERROR: " << x.what() << "\n";
         return 1;
      }
   }
   else
      std::cout << "unknown arguments. use -h for help.\n";
}
