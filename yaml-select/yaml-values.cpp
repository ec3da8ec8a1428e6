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

#include "yaml-select-internals.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/fmt/fmt.h>
#include <climits>
#include <cmath>

namespace YamlSelect
{
   namespace YamlSelectDetail
   {
      std::initializer_list<std::pair<EValueKind, char const *>> MapEValueKindName =
      {
         { EValueKind::Undefined, "undefined" },
         { EValueKind::Null,      "null" },
         { EValueKind::Bool,      "bool" },
         { EValueKind::Int,       "int" },
         { EValueKind::Float,     "float" },
         { EValueKind::String,    "string" },
         { EValueKind::Sequence,  "sequence" },
         { EValueKind::Map,       "map" },
      };

      namespace
      {
         char const * TagStr = "tag:yaml.org,2002:str";
         char const * TagInt = "tag:yaml.org,2002:int";
         char const * TagFloat = "tag:yaml.org,2002:float";
         char const * TagBool = "tag:yaml.org,2002:bool";
         char const * TagNull = "tag:yaml.org,2002:null";

         bool IsBoolText(std::string const & s)
         {
            return s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" || s == "FALSE";
         }

         std::string KindName(Node const & node)
         {
            return MapValue(KindOf(node), MapEValueKindName, "");
         }

         [[noreturn]] void Mismatch(char const * op, Node const & lhs, Node const & rhs)
         {
            throw QueryException(EQueryError::TypeMismatch, std::string(op) + " is not supported for " + KindName(lhs) + " and " + KindName(rhs));
         }

         bool IsIntegral(EValueKind kind) { return kind == EValueKind::Bool || kind == EValueKind::Int; }

         [[noreturn]] void Overflow()
         {
            throw QueryException(EQueryError::TypeMismatch, "integer overflow");
         }

         long long CheckedAdd(long long l, long long r)
         {
            if ((r > 0 && l > LLONG_MAX - r) || (r < 0 && l < LLONG_MIN - r))
               Overflow();
            return l + r;
         }

         long long CheckedSubtract(long long l, long long r)
         {
            if ((r < 0 && l > LLONG_MAX + r) || (r > 0 && l < LLONG_MIN + r))
               Overflow();
            return l - r;
         }

         long long CheckedMultiply(long long l, long long r)
         {
            if (l == 0 || r == 0)
               return 0;
            bool overflow = l > 0
               ? (r > 0 ? l > LLONG_MAX / r : r < LLONG_MIN / l)
               : (r > 0 ? l < LLONG_MIN / r : l < LLONG_MAX / r);
            if (overflow)
               Overflow();
            return l * r;
         }
      }

      /** \internal kind of a node.

         Plain scalars are typed the way the YAML core schema would type them: \c true / \c false are bools,
         numbers are ints or floats, everything else is a string. Quoted scalars and scalars tagged \c !!str are strings.
      */
      EValueKind KindOf(Node const & node)
      {
         if (!node.IsDefined())
            return EValueKind::Undefined;

         switch (node.Type())
         {
            case YAML::NodeType::Null:     return EValueKind::Null;
            case YAML::NodeType::Sequence: return EValueKind::Sequence;
            case YAML::NodeType::Map:      return EValueKind::Map;
            case YAML::NodeType::Scalar:   break;
            default:                       return EValueKind::Undefined;
         }

         std::string const & tag = node.Tag();
         if (tag == "!" || tag == TagStr)   return EValueKind::String;
         if (tag == TagInt)                 return EValueKind::Int;
         if (tag == TagFloat)               return EValueKind::Float;
         if (tag == TagBool)                return EValueKind::Bool;
         if (tag == TagNull)                return EValueKind::Null;
         if (!tag.empty() && tag != "?")    return EValueKind::String;    // custom tags: the text is taken as is

         if (IsBoolText(node.Scalar()))
            return EValueKind::Bool;

         long long i;
         if (YAML::convert<long long>::decode(node, i))
            return EValueKind::Int;

         double d;
         if (YAML::convert<double>::decode(node, d))
            return EValueKind::Float;

         return EValueKind::String;
      }

      bool IsNumeric(EValueKind kind)
      {
         return kind == EValueKind::Bool || kind == EValueKind::Int || kind == EValueKind::Float;
      }

      bool AsBool(Node const & node)
      {
         bool result = false;
         if (KindOf(node) != EValueKind::Bool || !YAML::convert<bool>::decode(node, result))
            throw QueryException(EQueryError::TypeMismatch, "expected a bool, got " + KindName(node));
         return result;
      }

      long long AsInt(Node const & node)
      {
         auto kind = KindOf(node);
         if (kind == EValueKind::Bool)
            return AsBool(node) ? 1 : 0;

         long long result = 0;
         if (kind != EValueKind::Int || !YAML::convert<long long>::decode(node, result))
            throw QueryException(EQueryError::TypeMismatch, "expected an int, got " + KindName(node));
         return result;
      }

      double AsDouble(Node const & node)
      {
         auto kind = KindOf(node);
         if (IsIntegral(kind))
            return static_cast<double>(AsInt(node));

         double result = 0;
         if (kind != EValueKind::Float || !YAML::convert<double>::decode(node, result))
            throw QueryException(EQueryError::TypeMismatch, "expected a number, got " + KindName(node));
         return result;
      }

      std::string const & AsString(Node const & node)
      {
         if (KindOf(node) != EValueKind::String)
            throw QueryException(EQueryError::TypeMismatch, "expected a string, got " + KindName(node));
         return node.Scalar();
      }

      Node MakeNull()
      {
         return Node(YAML::NodeType::Null);
      }

      Node MakeBool(bool value)
      {
         return Node(value ? "true" : "false");
      }

      Node MakeInt(long long value)
      {
         return Node(std::to_string(value));
      }

      /// the text always reads back as a float, e.g. 2.0 is written as "2.0"
      Node MakeFloat(double value)
      {
         if (std::isnan(value))
            return Node(".nan");
         if (std::isinf(value))
            return Node(value < 0 ? "-.inf" : ".inf");

         std::string text = fmt::format("{}", value);
         if (text.find_first_of(".eE") == std::string::npos)
            text += ".0";
         return Node(text);
      }

      /// the node is tagged as non-plain, so "123" stays a string
      Node MakeString(std::string value)
      {
         Node node(value);
         node.SetTag("!");
         return node;
      }

      /// python rules: null, false, zero, empty strings and empty containers are false
      bool IsTruthy(Node const & node)
      {
         switch (KindOf(node))
         {
            case EValueKind::Undefined:
            case EValueKind::Null:     return false;
            case EValueKind::Bool:     return AsBool(node);
            case EValueKind::Int:      return AsInt(node) != 0;
            case EValueKind::Float:    return AsDouble(node) != 0;
            case EValueKind::String:   return !node.Scalar().empty();
            case EValueKind::Sequence:
            case EValueKind::Map:      return node.size() != 0;
         }
         return false;
      }

      /** \internal structural equality.
          Numbers compare by value across bool, int and float. Values of different kinds are never equal.
      */
      bool ValuesEqual(Node const & lhs, Node const & rhs)
      {
         auto kl = KindOf(lhs);
         auto kr = KindOf(rhs);

         if (IsNumeric(kl) && IsNumeric(kr))
         {
            if (IsIntegral(kl) && IsIntegral(kr))
               return AsInt(lhs) == AsInt(rhs);
            return AsDouble(lhs) == AsDouble(rhs);
         }

         if (kl != kr)
            return false;

         switch (kl)
         {
            case EValueKind::Null:
               return true;

            case EValueKind::String:
               return lhs.Scalar() == rhs.Scalar();

            case EValueKind::Sequence:
            {
               if (lhs.size() != rhs.size())
                  return false;
               for (size_t i = 0; i < lhs.size(); ++i)
                  if (!ValuesEqual(lhs[i], rhs[i]))
                     return false;
               return true;
            }

            case EValueKind::Map:
            {
               if (lhs.size() != rhs.size())
                  return false;
               auto rentries = KeyEntries(rhs);
               for (auto && lentry : KeyEntries(lhs))
               {
                  auto match = std::find_if(rentries.begin(), rentries.end(), [&](auto const & r) { return ValuesEqual(lentry.first, r.first); });
                  if (match == rentries.end() || !ValuesEqual(lentry.second, match->second))
                     return false;
               }
               return true;
            }

            default:
               return false;
         }
      }

      /** \internal evaluates a comparison operator.
          (In)equality is defined for all values, ordering needs two numbers or two strings and throws \c TypeMismatch otherwise.
      */
      bool Compare(ECompareOp op, Node const & lhs, Node const & rhs)
      {
         if (op == ECompareOp::Equal)
            return ValuesEqual(lhs, rhs);
         if (op == ECompareOp::NotEqual)
            return !ValuesEqual(lhs, rhs);

         auto kl = KindOf(lhs);
         auto kr = KindOf(rhs);

         int cmp = 0;
         if (IsIntegral(kl) && IsIntegral(kr))
         {
            auto l = AsInt(lhs), r = AsInt(rhs);
            cmp = l < r ? -1 : (l > r ? 1 : 0);
         }
         else if (IsNumeric(kl) && IsNumeric(kr))
         {
            auto l = AsDouble(lhs), r = AsDouble(rhs);
            if (std::isnan(l) || std::isnan(r))
               return false;
            cmp = l < r ? -1 : (l > r ? 1 : 0);
         }
         else if (kl == EValueKind::String && kr == EValueKind::String)
            cmp = lhs.Scalar().compare(rhs.Scalar());
         else
            Mismatch("ordering", lhs, rhs);

         switch (op)
         {
            case ECompareOp::Less:         return cmp < 0;
            case ECompareOp::LessEqual:    return cmp <= 0;
            case ECompareOp::Greater:      return cmp > 0;
            case ECompareOp::GreaterEqual: return cmp >= 0;
            default:                       return false;
         }
      }

      /** \internal evaluates an arithmetic operator.
          Integers stay integers except for \c / , which always yields a float. \c % is floored (the result has the sign of the divisor).
          \c + concatenates two strings.
      */
      Node Arithmetic(EArithOp op, Node const & lhs, Node const & rhs)
      {
         auto kl = KindOf(lhs);
         auto kr = KindOf(rhs);

         if (op == EArithOp::Add && kl == EValueKind::String && kr == EValueKind::String)
            return MakeString(lhs.Scalar() + rhs.Scalar());

         if (!IsNumeric(kl) || !IsNumeric(kr))
            Mismatch("arithmetic", lhs, rhs);

         if (op == EArithOp::Divide)
         {
            double divisor = AsDouble(rhs);
            if (divisor == 0)
               throw QueryException(EQueryError::TypeMismatch, "division by zero");
            return MakeFloat(AsDouble(lhs) / divisor);
         }

         if (IsIntegral(kl) && IsIntegral(kr))
         {
            long long l = AsInt(lhs), r = AsInt(rhs);
            switch (op)
            {
               case EArithOp::Add:      return MakeInt(CheckedAdd(l, r));
               case EArithOp::Subtract: return MakeInt(CheckedSubtract(l, r));
               case EArithOp::Multiply: return MakeInt(CheckedMultiply(l, r));
               case EArithOp::Modulo:
               {
                  if (r == 0)
                     throw QueryException(EQueryError::TypeMismatch, "modulo by zero");
                  if (r == -1)
                     return MakeInt(0);    // LLONG_MIN % -1 traps
                  long long m = l % r;
                  if (m != 0 && ((m < 0) != (r < 0)))
                     m += r;
                  return MakeInt(m);
               }
               default: break;
            }
         }

         double l = AsDouble(lhs), r = AsDouble(rhs);
         switch (op)
         {
            case EArithOp::Add:      return MakeFloat(l + r);
            case EArithOp::Subtract: return MakeFloat(l - r);
            case EArithOp::Multiply: return MakeFloat(l * r);
            case EArithOp::Modulo:
            {
               if (r == 0)
                  throw QueryException(EQueryError::TypeMismatch, "modulo by zero");
               double m = std::fmod(l, r);
               if (m != 0 && ((m < 0) != (r < 0)))
                  m += r;
               return MakeFloat(m);
            }
            default: break;
         }
         throw QueryException(EQueryError::Internal, "unhandled arithmetic operator");
      }

      Node Negate(Node const & value)
      {
         auto kind = KindOf(value);
         if (IsIntegral(kind))
         {
            long long i = AsInt(value);
            if (i == LLONG_MIN)
               Overflow();
            return MakeInt(-i);
         }
         if (kind == EValueKind::Float)
            return MakeFloat(-AsDouble(value));
         throw QueryException(EQueryError::TypeMismatch, "cannot negate " + KindName(value));
      }

      /// splits UTF-8 text into code points. Invalid lead bytes are taken as single characters
      std::vector<std::string> SplitCodePoints(std::string const & s)
      {
         std::vector<std::string> result;
         for (size_t i = 0; i < s.size(); )
         {
            auto lead = static_cast<unsigned char>(s[i]);
            size_t len = 1;
            if ((lead & 0xE0) == 0xC0)       len = 2;
            else if ((lead & 0xF0) == 0xE0)  len = 3;
            else if ((lead & 0xF8) == 0xF0)  len = 4;

            len = std::min(len, s.size() - i);
            result.push_back(s.substr(i, len));
            i += len;
         }
         return result;
      }

      /// \internal (key, value) pairs of a map, or (index, element) pairs of a sequence
      std::vector<std::pair<Node, Node>> KeyEntries(Node const & node)
      {
         std::vector<std::pair<Node, Node>> entries;
         if (node.IsMap())
         {
            for (auto it = node.begin(); it != node.end(); ++it)
               entries.emplace_back(it->first, it->second);
         }
         else if (node.IsSequence())
         {
            for (size_t i = 0; i < node.size(); ++i)
               entries.emplace_back(MakeInt(static_cast<long long>(i)), node[i]);
         }
         return entries;
      }

      /// \internal elements of a sequence, keys of a map, or the characters of a string
      std::vector<Node> IndexElements(Node const & node)
      {
         std::vector<Node> elements;
         switch (KindOf(node))
         {
            case EValueKind::Sequence:
               for (auto && el : node)
                  elements.push_back(el);
               break;

            case EValueKind::Map:
               for (auto it = node.begin(); it != node.end(); ++it)
                  elements.push_back(it->first);
               break;

            case EValueKind::String:
               for (auto && ch : SplitCodePoints(node.Scalar()))
                  elements.push_back(MakeString(ch));
               break;

            default:
               break;
         }
         return elements;
      }
   }
}
