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

#pragma once

/* This exposes yaml-select details to make them accessible to tests.
*/

#include "yaml-select.h"
#include "yaml-pathquery.h"
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace YamlSelect
{
   namespace YamlSelectDetail
   {
      /// \internal state shared by a root selection and every selection derived from it
      struct SelectionContext
      {
         Node root;
         ClassifierConfig config;
      };

      /// \internal basic parser helper: removes \c offset chars from \c path, and returns the removed chars
      PathArg SplitAt(PathArg & path, size_t offset);

      /// \internal basic parser helper: removes chars from \c path until \c pred is false, and returns the removed chars
      template <typename TPred>
      PathArg Split(PathArg & path, TPred pred);

      /// \internal returns an integer in which the bit positions specified by \c values are set, \sa BitsContain
      template <typename TBits = uint64_t, typename T>
      constexpr uint64_t BitsOf(std::initializer_list<T> values);

      /// \internal checks if the bit at position \v is set in \c bits
      template<typename TBits, typename TValue>
      bool constexpr BitsContain(TBits bits, TValue v);

      template <typename T2, typename TEnum>
      T2 MapValue(TEnum value, std::initializer_list<std::pair<TEnum, T2>> values, T2 dflt = T2());


      // ----- values

      /// \internal kind of a node as seen by comparison, arithmetic and the builtin functions
      enum class EValueKind
      {
         Undefined,
         Null,
         Bool,
         Int,
         Float,
         String,
         Sequence,
         Map,
      };

      enum class ECompareOp { Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual };
      enum class EArithOp { Add, Subtract, Multiply, Divide, Modulo };
      enum class ELogicalOp { And, Or };

      EValueKind KindOf(Node const & node);
      bool IsNumeric(EValueKind kind);

      bool AsBool(Node const & node);          ///< throws TypeMismatch unless the node is a bool
      long long AsInt(Node const & node);      ///< bools and ints, throws TypeMismatch otherwise
      double AsDouble(Node const & node);      ///< bools, ints and floats, throws TypeMismatch otherwise
      std::string const & AsString(Node const & node);   ///< throws TypeMismatch unless the node is a string

      Node MakeNull();
      Node MakeBool(bool value);
      Node MakeInt(long long value);
      Node MakeFloat(double value);
      Node MakeString(std::string value);

      bool IsTruthy(Node const & node);
      bool ValuesEqual(Node const & lhs, Node const & rhs);
      bool Compare(ECompareOp op, Node const & lhs, Node const & rhs);
      Node Arithmetic(EArithOp op, Node const & lhs, Node const & rhs);
      Node Negate(Node const & value);

      std::vector<std::string> SplitCodePoints(std::string const & s);
      std::vector<std::pair<Node, Node>> KeyEntries(Node const & node);
      std::vector<Node> IndexElements(Node const & node);

      extern std::initializer_list<std::pair<EValueKind, char const *>> MapEValueKindName;


      // ----- token level

      /// \internal Tokens produced by \ref Lexer
      enum class EToken
      {
         Invalid = -1,
         None = 0,         // end of query
         Root,             // $
         Current,          // @
         Period,           // .
         DoublePeriod,     // ..
         Asterisk,
         OpenBracket,
         CloseBracket,
         OpenParen,
         CloseParen,
         Comma,
         Colon,
         Pipe,
         Plus,
         Minus,
         Slash,
         Percent,
         Equal,
         NotEqual,
         Less,
         LessEqual,
         Greater,
         GreaterEqual,
         String,
         Integer,
         Float,
         Identifier,
         And,
         Or,
         True,
         False,
         Null,
      };
      /* when adding a new token, also add to:
            - MapETokenName
            - Lexer::NextToken, to recognize it
            - Parser, to process it
      */

      /// \internal data for one token, see \ref Lexer
      struct TokenData
      {
         EToken      id = EToken::None;
         PathArg     text;             // the token as written in the query
         std::string value;            // unescaped content of a string literal
         long long   integer = 0;
         double      number = 0;
         size_t      offset = 0;
         size_t      line = 1;
         size_t      column = 1;
      };

      /** \internal token level scanner for a PathQuery

         \ref NextToken removes the next token from the query and makes it the current one, until the end of the query
         is reached (\c EToken::None). Whitespace and line breaks between tokens are skipped.
         Malformed tokens throw a \ref QueryException with \c EQueryError::LexError.
      */
      class Lexer
      {
      public:
         explicit Lexer(PathArg query);

         TokenData const & NextToken();
         TokenData const & Token() const { return m_curToken; }
         std::vector<TokenData> Tokenize();

         size_t ScanOffset() const { return m_query.length() - m_rpath.length(); }   ///< token scanner position

      private:
         PathArg     m_rpath;        // remainder of query to be scanned
         PathArg     m_query;
         TokenData   m_curToken;
         size_t      m_line = 1;
         size_t      m_lineStart = 0;

         void SkipWS();
         TokenData const & SetToken(EToken id, size_t offset, PathArg text);
         void ScanString(size_t offset);
         void ScanNumber(size_t offset);
         [[noreturn]] void Fail(std::string detail, size_t offset) const;
      };


      // ----- path expression tree (PET) and filter expression tree (FET)

      struct FilterExpr;
      using FilterPtr = std::unique_ptr<FilterExpr>;

      enum class EAnchor { Root, Current };

      struct StepKey { std::string name; bool deep = false; };
      struct StepAll { bool deep = false; };
      struct StepIndex { IndexSelector selector; };
      struct StepElement { IndexSelector selector; };
      struct StepExpand {};
      struct StepFilter { FilterPtr expr; };
      struct StepCall { std::string name; std::vector<FilterPtr> args; };

      using tStep = std::variant<StepKey, StepAll, StepIndex, StepElement, StepExpand, StepFilter, StepCall>;

      struct PathExpr
      {
         EAnchor anchor = EAnchor::Root;
         std::vector<tStep> steps;
      };

      /// a union of path expressions, results are concatenated
      struct PathUnion
      {
         std::vector<PathExpr> paths;
      };

      struct FilterExpr
      {
         struct PathRef { PathUnion path; };
         struct Literal { Node value; };
         struct Compare { ECompareOp op; FilterPtr left; FilterPtr right; };
         struct Arith { EArithOp op; FilterPtr left; FilterPtr right; };
         struct Negate { FilterPtr operand; };
         struct Logical { ELogicalOp op; FilterPtr left; FilterPtr right; };
         struct Call { std::string name; std::vector<FilterPtr> args; };

         std::variant<PathRef, Literal, Compare, Arith, Negate, Logical, Call> node;
         size_t offset = 0;
      };

      /// \internal the result of parsing a complete query
      struct QueryExpr
      {
         PathUnion path;
      };

      std::string Dump(PathUnion const & path);
      std::string Dump(FilterExpr const & expr);
      std::string Dump(IndexSelector const & selector);

      extern std::initializer_list<std::pair<EToken, char const *>> MapETokenName;
      extern std::initializer_list<std::pair<EQueryError, char const *>> MapEQueryErrorName;


      // ----- parser

      /** \internal recursive descent parser for PathQuery strings

         The whole query is scanned by \ref Lexer first. Each Parse method consumes the complete query or throws a
         \ref QueryException: \c EQueryError::SyntaxError for an unexpected token, \c EQueryError::UnexpectedEnd if the
         query ends early.
      */
      class Parser
      {
      public:
         explicit Parser(PathArg query);

         QueryExpr ParseQuery();       ///< <code>path ('|' path)*</code> or a single function call
         FilterPtr ParseFilter();      ///< a complete filter expression
         FilterPtr ParseCall();        ///< a single function call

         inline static const size_t MaxNesting = 256;

      private:
         PathArg m_query;
         std::vector<TokenData> m_tokens;
         size_t m_pos = 0;
         size_t m_nesting = 0;

         TokenData const & Peek(size_t ahead = 0) const;
         TokenData const & Next();
         bool Accept(EToken id);
         TokenData const & Expect(uint64_t validTokens);
         void ExpectEnd();
         [[noreturn]] void Fail(TokenData const & at, uint64_t validTokens = 0) const;
         [[noreturn]] void FailWith(TokenData const & at, EQueryError error, std::string detail) const;

         PathUnion ParseUnion();
         PathExpr ParsePath();
         bool IsSelectorAhead() const;
         IndexSelector ParseSelector();
         std::optional<long long> ParseOptionalInt();
         long long ParseInt();

         FilterPtr ParseOr();
         FilterPtr ParseAnd();
         FilterPtr ParseComparison();
         FilterPtr ParseAdditive();
         FilterPtr ParseTerm();
         FilterPtr ParseFactor();
         FilterPtr ParseCallExpr();

         class NestingGuard;
      };


      // ----- evaluator

      /** \internal walks a parsed query against a selection

         Path steps map onto \ref Selection operators. Filter expressions are evaluated per candidate; an operand path
         with an empty result ends the evaluation of the candidate (\c std::nullopt), which rejects it.
      */
      class Evaluator
      {
      public:
         explicit Evaluator(FunctionRegistry const & functions) : m_functions(functions) {}

         Selection EvalQuery(QueryExpr const & query, Selection const & cur) const;
         bool EvalPredicate(FilterExpr const & expr, Selection const & cur, Selection const & root) const;
         Node EvalCall(FilterExpr const & expr, Selection const & cur, Selection const & root) const;

         void CheckFunctions(PathUnion const & path) const;
         void CheckFunctions(FilterExpr const & expr) const;

      private:
         FunctionRegistry const & m_functions;

         Selection EvalUnion(PathUnion const & path, Selection const & cur, Selection const & root, size_t depth) const;
         Selection EvalPath(PathExpr const & path, Selection const & cur, Selection const & root, size_t depth) const;
         Selection ApplyStep(tStep const & step, Selection const & current, Selection const & root, size_t depth) const;

         std::optional<bool> EvalCondition(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const;
         std::optional<Node> EvalValue(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const;
         Selection EvalArgument(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const;
         std::optional<Node> CallFunction(PathArg name, std::vector<FilterPtr> const & args, Selection const & cur, Selection const & root, size_t depth) const;

         void CheckDepth(size_t depth, Selection const & cur) const;
      };
   }
}

// ----- Implementation

namespace YamlSelect
{
   namespace YamlSelectDetail
   {
      template <typename TPred>
      PathArg Split(PathArg & path, TPred pred)
      {
         size_t offset = 0;
         while (offset < path.size() && pred(path[offset]))
            ++offset;
         return SplitAt(path, offset);
      }

      template <typename TBits, typename T>
      constexpr uint64_t BitsOf(std::initializer_list<T> values)
      {
         uint64_t bits = 0;
         for (auto v : values)
            bits |= TBits(1) << TBits(v);
         return bits;
      }

      template<typename TBits, typename TValue>
      bool constexpr BitsContain(TBits bits, TValue v)
      {
         return ((TBits(1) << TBits(v)) & bits) != 0;
      }

      /// \internal helper to map enum values to names, used for diagnostics
      template <typename T2, typename TEnum>
      T2 MapValue(TEnum value, std::initializer_list<std::pair<TEnum, T2>> values, T2 dflt)
      {
         for (auto && p : values)
            if (p.first == value)
               return p.second;
         return dflt;
      }
   }
}
