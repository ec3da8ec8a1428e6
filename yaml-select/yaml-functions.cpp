/*
MIT License

Copyright(c) 2019 Peter Hauptmann

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files(the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions :

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include "yaml-pathquery.h"
#include "yaml-select-internals.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/fmt/fmt.h>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace YamlSelect
{
   using namespace YamlSelectDetail;

   // ----- FunctionRegistry

   /// adds \c func as \c name. An existing function of the same name is replaced.
   FunctionRegistry & FunctionRegistry::Register(std::string name, QueryFunction func)
   {
      m_functions[std::move(name)] = std::move(func);
      return *this;
   }

   bool FunctionRegistry::Remove(PathArg name)
   {
      auto it = m_functions.find(name);
      if (it == m_functions.end())
         return false;
      m_functions.erase(it);
      return true;
   }

   QueryFunction const * FunctionRegistry::Find(PathArg name) const
   {
      auto it = m_functions.find(name);
      return it == m_functions.end() ? nullptr : &it->second;
   }

   /// calls the function \c name, throws \c EQueryError::UnknownFunction if there is none
   Node FunctionRegistry::Call(PathArg name, Selection const & first, std::vector<Node> const & rest) const
   {
      auto func = Find(name);
      if (!func)
         throw QueryException(EQueryError::UnknownFunction, std::string(name));
      return (*func)(first, rest);
   }

   std::vector<std::string> FunctionRegistry::Names() const
   {
      std::vector<std::string> names;
      for (auto && f : m_functions)
         names.push_back(f.first);
      return names;
   }


   // ----- builtin functions

   namespace
   {
      [[noreturn]] void Invalid(char const * func, std::string const & detail)
      {
         throw QueryException(EQueryError::InvalidArgument, std::string(func) + ": " + detail);
      }

      std::string KindName(Node const & node)
      {
         return MapValue(KindOf(node), MapEValueKindName, "");
      }

      void CheckArgs(char const * func, std::vector<Node> const & rest, size_t minCount, size_t maxCount)
      {
         if (rest.size() < minCount || rest.size() > maxCount)
         {
            if (minCount == maxCount)
               Invalid(func, "expects " + std::to_string(minCount + 1) + " argument(s), got " + std::to_string(rest.size() + 1));
            Invalid(func, "expects " + std::to_string(minCount + 1) + " to " + std::to_string(maxCount + 1) + " arguments, got " + std::to_string(rest.size() + 1));
         }
      }

      /// the first item of the first argument
      Node FirstItem(char const * func, Selection const & first)
      {
         if (first.Empty())
            Invalid(func, "the first argument selects nothing");
         return first[0];
      }

      std::string const & StringArg(char const * func, Node const & node)
      {
         if (KindOf(node) != EValueKind::String)
            Invalid(func, "expected a string, got " + KindName(node));
         return node.Scalar();
      }

      long long IntArg(char const * func, Node const & node)
      {
         auto kind = KindOf(node);
         if (kind != EValueKind::Int && kind != EValueKind::Bool)
            Invalid(func, "expected an integer, got " + KindName(node));
         return AsInt(node);
      }

      /// converts an integral double, \c InvalidArgument if it is NaN or outside the range of \c long \c long
      long long IntFromDouble(char const * func, double d)
      {
         if (!(d >= -9.2233720368547758e18 && d < 9.2233720368547758e18))
            Invalid(func, fmt::format("{} is outside the integer range", d));
         return static_cast<long long>(d);
      }

      std::optional<long long> OptionalIntArg(char const * func, std::vector<Node> const & rest, size_t index)
      {
         if (index >= rest.size() || KindOf(rest[index]) == EValueKind::Null)
            return std::nullopt;
         return IntArg(func, rest[index]);
      }

      // ASCII classification, bytes of multi-byte UTF-8 sequences are neither letters nor digits
      bool IsSpace(char c) { return isascii(c) && isspace(c); }
      bool IsDigit(char c) { return isascii(c) && isdigit(c); }
      bool IsAlpha(char c) { return isascii(c) && isalpha(c); }
      bool IsUpper(char c) { return isascii(c) && isupper(c); }
      bool IsLower(char c) { return isascii(c) && islower(c); }
      char ToUpper(char c) { return IsLower(c) ? char(toupper(c)) : c; }
      char ToLower(char c) { return IsUpper(c) ? char(tolower(c)) : c; }

      template <typename TPred>
      bool AllOf(std::string const & s, TPred pred)
      {
         return !s.empty() && std::all_of(s.begin(), s.end(), pred);
      }

      std::string Trim(std::string const & s, bool left, bool right)
      {
         size_t start = 0, end = s.size();
         if (left)
            while (start < end && IsSpace(s[start]))
               ++start;
         if (right)
            while (end > start && IsSpace(s[end - 1]))
               --end;
         return s.substr(start, end - start);
      }

      /// \internal uppercase letters only after uncased characters, lowercase letters only after cased ones
      bool IsTitle(std::string const & s)
      {
         bool cased = false, prevCased = false;
         for (char c : s)
         {
            if (IsUpper(c))
            {
               if (prevCased)
                  return false;
               prevCased = cased = true;
            }
            else if (IsLower(c))
            {
               if (!prevCased)
                  return false;
               prevCased = cased = true;
            }
            else
               prevCased = false;
         }
         return cased;
      }

      std::string Title(std::string s)
      {
         bool prevCased = false;
         for (char & c : s)
         {
            bool cased = IsAlpha(c);
            c = prevCased ? ToLower(c) : ToUpper(c);
            prevCased = cased;
         }
         return s;
      }

      std::string Replace(std::string const & s, std::string const & from, std::string const & to)
      {
         std::string result;
         if (from.empty())
         {
            result = to;
            for (auto && cp : SplitCodePoints(s))
               result += cp + to;
            return result;
         }

         size_t pos = 0;
         for (;;)
         {
            size_t hit = s.find(from, pos);
            if (hit == std::string::npos)
               break;
            result.append(s, pos, hit - pos);
            result += to;
            pos = hit + from.size();
         }
         result.append(s, pos, std::string::npos);
         return result;
      }

      std::string Normalize(std::string const & s)
      {
         std::string result;
         bool pendingSpace = false;
         for (char c : s)
         {
            if (IsSpace(c))
            {
               pendingSpace = !result.empty();
               continue;
            }
            if (pendingSpace)
               result += ' ';
            pendingSpace = false;
            result += c;
         }
         return result;
      }

      /// text of a value: strings as they are, other scalars in canonical form, containers as flow YAML
      std::string ToText(Node const & node)
      {
         switch (KindOf(node))
         {
            case EValueKind::String:   return node.Scalar();
            case EValueKind::Null:     return "null";
            case EValueKind::Bool:     return AsBool(node) ? "true" : "false";
            case EValueKind::Int:      return MakeInt(AsInt(node)).Scalar();
            case EValueKind::Float:    return MakeFloat(AsDouble(node)).Scalar();
            case EValueKind::Undefined: return std::string();
            default:
            {
               YAML::Emitter out;
               out << YAML::Flow << node;
               return out.c_str();
            }
         }
      }

      Node ToInt(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("toint", rest, 0, 0);
         Node value = FirstItem("toint", first);
         switch (KindOf(value))
         {
            case EValueKind::Bool:
            case EValueKind::Int:
               return MakeInt(AsInt(value));

            case EValueKind::Float:
            {
               return MakeInt(IntFromDouble("toint", std::trunc(AsDouble(value))));
            }

            case EValueKind::String:
            {
               std::string text = Trim(value.Scalar(), true, true);
               char const * begin = text.c_str();
               if (*begin == '+')
                  ++begin;
               long long result = 0;
               auto parsed = std::from_chars(begin, text.c_str() + text.size(), result);
               if (parsed.ec != std::errc() || parsed.ptr != text.c_str() + text.size() || begin == text.c_str() + text.size())
                  Invalid("toint", "'" + value.Scalar() + "' is not an integer");
               return MakeInt(result);
            }

            default:
               Invalid("toint", "cannot convert " + KindName(value) + " to an integer");
         }
      }

      Node ToFloat(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("toflt", rest, 0, 0);
         Node value = FirstItem("toflt", first);
         auto kind = KindOf(value);
         if (IsNumeric(kind))
            return MakeFloat(AsDouble(value));

         if (kind == EValueKind::String)
         {
            std::string text = Trim(value.Scalar(), true, true);
            char * end = nullptr;
            double result = std::strtod(text.c_str(), &end);
            if (text.empty() || end != text.c_str() + text.size())
               Invalid("toflt", "'" + value.Scalar() + "' is not a number");
            return MakeFloat(result);
         }
         Invalid("toflt", "cannot convert " + KindName(value) + " to a float");
      }

      Node ToStr(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("tostr", rest, 0, 0);
         return MakeString(ToText(FirstItem("tostr", first)));
      }

      /// <code>get(sel, n)</code>: the n-th item of the selection, negative values count from the end
      Node Get(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("get", rest, 1, 1);
         long long index = IntArg("get", rest[0]);
         long long size = static_cast<long long>(first.Size());
         if (index < -size || index >= size)
            Invalid("get", "index " + std::to_string(index) + " out of range");
         return first[index];
      }

      Node Len(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("len", rest, 0, 0);
         Node value = FirstItem("len", first);
         switch (KindOf(value))
         {
            case EValueKind::String:   return MakeInt(static_cast<long long>(SplitCodePoints(value.Scalar()).size()));
            case EValueKind::Sequence:
            case EValueKind::Map:      return MakeInt(static_cast<long long>(value.size()));
            default:                   Invalid("len", KindName(value) + " has no length");
         }
      }

      /// builds a type test, e.g. \c isint
      QueryFunction KindTest(char const * name, std::initializer_list<EValueKind> kinds)
      {
         std::vector<EValueKind> accepted(kinds);
         return [name, accepted](Selection const & first, std::vector<Node> const & rest)
         {
            CheckArgs(name, rest, 0, 0);
            auto kind = KindOf(FirstItem(name, first));
            return MakeBool(std::find(accepted.begin(), accepted.end(), kind) != accepted.end());
         };
      }

      /// builds a function taking one string, e.g. \c lower
      template <typename TFunc>
      QueryFunction StringFunc(char const * name, TFunc func)
      {
         return [name, func](Selection const & first, std::vector<Node> const & rest)
         {
            CheckArgs(name, rest, 0, 0);
            return func(StringArg(name, FirstItem(name, first)));
         };
      }

      /// builds a function taking two strings, e.g. \c startswith
      template <typename TFunc>
      QueryFunction StringFunc2(char const * name, TFunc func)
      {
         return [name, func](Selection const & first, std::vector<Node> const & rest)
         {
            CheckArgs(name, rest, 1, 1);
            return func(StringArg(name, FirstItem(name, first)), StringArg(name, rest[0]));
         };
      }

      /** <code>rnd(sel, digits)</code>: rounds half to even. Integers stay integers. */
      Node Round(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("rnd", rest, 0, 1);
         Node value = FirstItem("rnd", first);
         auto kind = KindOf(value);
         if (!IsNumeric(kind))
            Invalid("rnd", "expected a number, got " + KindName(value));

         long long digits = rest.empty() ? 0 : IntArg("rnd", rest[0]);
         if (kind != EValueKind::Float)
         {
            long long i = AsInt(value);
            if (digits >= 0)
               return MakeInt(i);
            double scale = std::pow(10.0, static_cast<double>(-digits));
            if (std::isinf(scale))
               return MakeInt(0);
            return MakeInt(IntFromDouble("rnd", std::nearbyint(i / scale) * scale));
         }

         double scale = std::pow(10.0, static_cast<double>(digits));
         double d = AsDouble(value);
         double result = d;
         if (scale == 0)
            result = 0;
         else if (std::isfinite(d * scale))
            result = std::nearbyint(d * scale) / scale;
         return rest.empty() ? MakeInt(IntFromDouble("rnd", result)) : MakeFloat(result);
      }

      /** <code>slice(sel, start, stop, step)</code>: a python-style slice of a string or sequence.
          Omitted bounds and \c null mean open.
      */
      Node SliceFunc(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("slice", rest, 1, 3);
         Node value = FirstItem("slice", first);
         Slice slice{ OptionalIntArg("slice", rest, 0), OptionalIntArg("slice", rest, 1), OptionalIntArg("slice", rest, 2) };

         auto kind = KindOf(value);
         if (kind != EValueKind::String && kind != EValueKind::Sequence)
            Invalid("slice", "cannot slice " + KindName(value));

         auto parts = first.Derive(IndexElements(value)).I(slice);
         if (kind == EValueKind::String)
         {
            std::string result;
            for (auto && part : parts)
               result += part.Scalar();
            return MakeString(result);
         }

         Node result(YAML::NodeType::Sequence);
         for (auto && part : parts)
            result.push_back(part);
         return result;
      }

      Node ReplaceFunc(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("replace", rest, 2, 2);
         auto const & text = StringArg("replace", FirstItem("replace", first));
         return MakeString(Replace(text, StringArg("replace", rest[0]), StringArg("replace", rest[1])));
      }

      Node Count(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("count", rest, 0, 0);
         return MakeInt(static_cast<long long>(first.Size()));
      }

      /// false for an empty selection
      Node All(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("all", rest, 0, 0);
         return MakeBool(!first.Empty() && std::all_of(first.begin(), first.end(), [](Node const & n) { return IsTruthy(n); }));
      }

      Node Any(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("any", rest, 0, 0);
         return MakeBool(std::any_of(first.begin(), first.end(), [](Node const & n) { return IsTruthy(n); }));
      }

      Node Has(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("has", rest, 0, 0);
         return MakeBool(!first.Empty());
      }

      Node No(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("no", rest, 0, 0);
         return MakeBool(first.Empty());
      }

      /** <code>inval(sel, v)</code>: \c v is a substring of a string, an element of a sequence, or a key of a map */
      Node InVal(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("inval", rest, 1, 1);
         Node container = FirstItem("inval", first);
         Node const & value = rest[0];
         switch (KindOf(container))
         {
            case EValueKind::String:
               return MakeBool(container.Scalar().find(StringArg("inval", value)) != std::string::npos);

            case EValueKind::Sequence:
            case EValueKind::Map:
            {
               auto elements = IndexElements(container);
               return MakeBool(std::any_of(elements.begin(), elements.end(), [&](Node const & n) { return ValuesEqual(n, value); }));
            }

            default:
               Invalid("inval", "cannot search in " + KindName(container));
         }
      }

      /// <code>initems(sel, v)</code>: one of the items equals \c v
      Node InItems(Selection const & first, std::vector<Node> const & rest)
      {
         CheckArgs("initems", rest, 1, 1);
         Node const & value = rest[0];
         return MakeBool(std::any_of(first.begin(), first.end(), [&](Node const & n) { return ValuesEqual(n, value); }));
      }

      /// a sequence of the items of the first argument, followed by the values of the other arguments
      Node Concat(Selection const & first, std::vector<Node> const & rest)
      {
         Node result(YAML::NodeType::Sequence);
         for (auto && item : first)
            result.push_back(item);
         for (auto && value : rest)
            result.push_back(value);
         return result;
      }

      FunctionRegistry CreateBuiltins()
      {
         FunctionRegistry reg;

         // conversion
         reg.Register("toint", ToInt)
            .Register("toflt", ToFloat)
            .Register("tostr", ToStr)
            .Register("get", Get)
            .Register("len", Len);

         // type tests
         reg.Register("isnum", KindTest("isnum", { EValueKind::Int, EValueKind::Float }))
            .Register("isint", KindTest("isint", { EValueKind::Int }))
            .Register("isflt", KindTest("isflt", { EValueKind::Float }))
            .Register("isbool", KindTest("isbool", { EValueKind::Bool }))
            .Register("isstr", KindTest("isstr", { EValueKind::String }))
            .Register("isnull", KindTest("isnull", { EValueKind::Null }))
            .Register("isarr", KindTest("isarr", { EValueKind::Sequence }))
            .Register("isobj", KindTest("isobj", { EValueKind::Map }));

         reg.Register("rnd", Round)
            .Register("slice", SliceFunc)
            .Register("replace", ReplaceFunc);

         // string tests
         reg.Register("isdigit", StringFunc("isdigit", [](std::string const & s) { return MakeBool(AllOf(s, IsDigit)); }))
            .Register("isalpha", StringFunc("isalpha", [](std::string const & s) { return MakeBool(AllOf(s, IsAlpha)); }))
            .Register("isalnum", StringFunc("isalnum", [](std::string const & s) { return MakeBool(AllOf(s, [](char c) { return IsAlpha(c) || IsDigit(c); })); }))
            .Register("isspace", StringFunc("isspace", [](std::string const & s) { return MakeBool(AllOf(s, IsSpace)); }))
            .Register("islower", StringFunc("islower", [](std::string const & s)
               { return MakeBool(std::any_of(s.begin(), s.end(), IsLower) && std::none_of(s.begin(), s.end(), IsUpper)); }))
            .Register("isupper", StringFunc("isupper", [](std::string const & s)
               { return MakeBool(std::any_of(s.begin(), s.end(), IsUpper) && std::none_of(s.begin(), s.end(), IsLower)); }))
            .Register("istitle", StringFunc("istitle", [](std::string const & s) { return MakeBool(IsTitle(s)); }));

         // string transformations
         reg.Register("lower", StringFunc("lower", [](std::string s) { std::transform(s.begin(), s.end(), s.begin(), ToLower); return MakeString(s); }))
            .Register("upper", StringFunc("upper", [](std::string s) { std::transform(s.begin(), s.end(), s.begin(), ToUpper); return MakeString(s); }))
            .Register("capitalize", StringFunc("capitalize", [](std::string s)
               {
                  std::transform(s.begin(), s.end(), s.begin(), ToLower);
                  if (!s.empty())
                     s[0] = ToUpper(s[0]);
                  return MakeString(s);
               }))
            .Register("title", StringFunc("title", [](std::string const & s) { return MakeString(Title(s)); }))
            .Register("ltrim", StringFunc("ltrim", [](std::string const & s) { return MakeString(Trim(s, true, false)); }))
            .Register("rtrim", StringFunc("rtrim", [](std::string const & s) { return MakeString(Trim(s, false, true)); }))
            .Register("trim", StringFunc("trim", [](std::string const & s) { return MakeString(Trim(s, true, true)); }))
            .Register("normalize", StringFunc("normalize", [](std::string const & s) { return MakeString(Normalize(s)); }));

         reg.Register("startswith", StringFunc2("startswith", [](std::string const & s, std::string const & prefix)
               { return MakeBool(s.compare(0, prefix.size(), prefix) == 0 && s.size() >= prefix.size()); }))
            .Register("endswith", StringFunc2("endswith", [](std::string const & s, std::string const & suffix)
               { return MakeBool(s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0); }))
            .Register("instr", StringFunc2("instr", [](std::string const & s, std::string const & part)
               { return MakeBool(s.find(part) != std::string::npos); }));

         // selection
         reg.Register("count", Count)
            .Register("all", All)
            .Register("any", Any)
            .Register("has", Has)
            .Register("no", No)
            .Register("inval", InVal)
            .Register("initems", InItems)
            .Register("concat", Concat);

         return reg;
      }
   }

   /// the builtin functions. Copy the table to add or replace functions for a \ref PathQuery
   FunctionRegistry const & FunctionRegistry::Builtins()
   {
      static FunctionRegistry const builtins = CreateBuiltins();
      return builtins;
   }
}
