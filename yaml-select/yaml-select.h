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

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <yaml-cpp/node/node.h>

namespace YamlSelect
{
   using YAML::Node;

   /** \c PathArg is used by yaml-select for string arguments that are only read (keys, query strings, names).

       Implementation detail: \c PathArg is a typedef for \c std::string_view.
   */
   using PathArg = std::string_view;

   class Selection;
   struct SelectionMeta;

   /** Error code used by yaml-select. For information on error handling, see \ref QueryException */
   enum class EQueryError
   {
      OK = 0,
      Internal,

      // parsing errors
      LexError,
      SyntaxError,
      UnexpectedEnd,

      // evaluation errors
      FirstEvalError_ = 100,     ///< all error codes after this indicate the query was well-formed, but could not be evaluated
      InvalidSelectorType,
      UnknownFunction,
      InvalidArgument,
      FunctionFailed,
      TypeMismatch,
      RecursionLimitExceeded,

      // configuration errors
      FirstConfigError_ = 200,
      InvalidConfig,
      /* to add a new error code, also add: a name to MapEQueryErrorName */
   };

   namespace YamlSelectDetail { class Lexer; class Parser; }

   /** Exception and diagnostics for yaml-select */
   class QueryException : public std::exception
   {
   public:
      QueryException() = default;
      explicit QueryException(EQueryError error, std::string detail = std::string());

      EQueryError Error() const { return m_error; }                  ///< error code for this exception
      bool IsParseError() const { return IsParseError(m_error); }   ///< true if the query string is malformed
      bool IsEvalError() const { return IsEvalError(m_error); }     ///< true if a well-formed query failed during evaluation
      bool IsConfigError() const { return IsConfigError(m_error); } ///< true if a classifier configuration could not be loaded

      std::string FullQuery() const { return m_query; }            ///< the query that was used by the failing command, if any
      std::string ValidQuery() const { return m_query.substr(0, std::min(m_offset, m_query.size())); }  ///< the part of the query that was scanned without error
      std::size_t ErrorOffset() const { return m_offset; }         ///< index into the query where the error occurred
      std::size_t Line() const { return m_line; }                  ///< 1-based line of the error position (parse errors only)
      std::size_t Column() const { return m_column; }              ///< 1-based column of the error position (parse errors only)
      std::string const & Detail() const { return m_detail; }      ///< error specific detail, e.g. the unexpected token

      char const * what() const noexcept override { return What().c_str(); }   ///< overrides \c std::exception::what, returning the detailed error message from \ref What
      std::string const & What(bool detailed = true) const;

      static std::string GetErrorMessage(EQueryError error);
      static bool IsParseError(EQueryError error) { return error < EQueryError::FirstEvalError_ && error != EQueryError::OK; }
      static bool IsEvalError(EQueryError error) { return error > EQueryError::FirstEvalError_ && error < EQueryError::FirstConfigError_; }
      static bool IsConfigError(EQueryError error) { return error > EQueryError::FirstConfigError_; }

   private:
      friend class YamlSelectDetail::Lexer;     // lexer and parser feed the scan position
      friend class YamlSelectDetail::Parser;
      friend class CompiledQuery;               // attaches the query text to evaluation errors

      void SetPosition(PathArg query, std::size_t offset, std::size_t line, std::size_t column);

      EQueryError m_error = EQueryError::OK;
      std::string m_detail;
      std::string m_query;
      std::size_t m_offset = 0;
      std::size_t m_line = 0;
      std::size_t m_column = 0;

      // will be generated on demand
      mutable std::string m_short;
      mutable std::string m_detailed;
   };


   // ----- Type classifier

   /// shape tags assigned by \ref ShapeTagsOf. Any explicit YAML tag of a node (e.g. \c "!bag") is a shape tag, too.
   namespace ShapeTag
   {
      inline constexpr char const * Map = "map";
      inline constexpr char const * Sequence = "sequence";
      inline constexpr char const * String = "string";
      inline constexpr char const * Scalar = "scalar";
      inline constexpr char const * Null = "null";
      inline constexpr char const * Iterable = "iterable";   ///< generic ordered iterable: maps, sequences and strings
   }

   /** Decides which values can be iterated by key or by index.

      A value is index-iterable if one of its shape tags is in \c iterableByIndex, and none is in \c excludedFromIndexIteration.
      The same rule applies for key iteration. The default configuration treats sequences as index-iterable, maps as key-iterable,
      and keeps strings from being split into characters by deep traversal.
   */
   struct ClassifierConfig
   {
      using ShapeSet = std::set<std::string, std::less<>>;

      ShapeSet iterableByIndex;
      ShapeSet iterableByKey;
      ShapeSet excludedFromIndexIteration;
      ShapeSet excludedFromKeyIteration;
      std::size_t maxDepth = 256;     ///< recursion ceiling for deep traversal and nested query evaluation

      static ClassifierConfig Default();
      static ClassifierConfig FromYaml(Node const & config, ClassifierConfig base = Default());
      static ClassifierConfig LoadFile(std::string const & path);
   };

   /// iteration capabilities of a value, see \ref Classify
   struct Shape
   {
      bool byKey = false;
      bool byIndex = false;

      bool IsOpaque() const { return !byKey && !byIndex; }
   };

   std::vector<std::string> ShapeTagsOf(Node const & node);
   Shape Classify(Node const & node, ClassifierConfig const & config);


   // ----- Selectors for Selection::I and Selection::El

   /// python-style slice: open bounds default to the full range, negative values count from the end
   struct Slice
   {
      std::optional<long long> start;
      std::optional<long long> stop;
      std::optional<long long> step;
   };

   /** Index argument for \ref Selection::I and \ref Selection::El

      Holds a single index, a list of indices, a \ref Slice, or a node. A node is checked when the selector is used:
      an integer scalar is a single index, a sequence of integer scalars is a list of indices, anything else
      raises \c EQueryError::InvalidSelectorType.
   */
   class IndexSelector
   {
   public:
      using tValue = std::variant<long long, std::vector<long long>, Slice, Node>;

      IndexSelector(long long index) : m_value(index) {}
      IndexSelector(std::vector<long long> indices) : m_value(std::move(indices)) {}
      IndexSelector(std::initializer_list<long long> indices) : m_value(std::vector<long long>(indices)) {}
      IndexSelector(Slice slice) : m_value(slice) {}
      IndexSelector(Node const & node) : m_value(node) {}

      tValue const & Value() const { return m_value; }

   private:
      tValue m_value;
   };


   // ----- Selection

   namespace YamlSelectDetail
   {
      struct SelectionContext;
      void LogSwallowed(char const * operation, std::size_t index, char const * what);
   }

   /** An ordered, immutable set of nodes selected from one tree.

      Every operator returns a new \c Selection, sharing root node and \ref ClassifierConfig with the selection it was derived from.
      A root selection is created from a node; it holds that node as its only item.
   */
   class Selection
   {
   public:
      using Items = std::vector<Node>;
      using const_iterator = Items::const_iterator;

      /// filter predicate: (index of the item, one-item selection holding the item, root selection) -> accept
      using Predicate = std::function<bool(std::size_t index, Selection const & cur, Selection const & root)>;

      explicit Selection(Node root, ClassifierConfig config = ClassifierConfig::Default());
      Selection(Selection const & other) = default;
      Selection(Selection && other) = default;

      /// the item list is swapped in, never assigned element-wise: assigning a yaml-cpp node overwrites the node it refers to
      Selection & operator=(Selection other) noexcept
      {
         m_context.swap(other.m_context);
         m_items.swap(other.m_items);
         return *this;
      }

      // ----- selection operators
      Selection One(PathArg key, bool deep = false) const;
      Selection All(bool deep = false) const;
      Selection I(IndexSelector const & selector) const;
      Selection El(IndexSelector const & selector) const;
      Selection Exp() const;
      Selection Filter(Predicate const & predicate) const;

      /** calls <code>func(item, args...)</code> for the item at \c index and returns the result.
          Throws \c std::out_of_range for an invalid index, exceptions from \c func propagate.
      */
      template <typename TFunc, typename... TArgs>
      decltype(auto) Call4Item(long long index, TFunc && func, TArgs &&... args) const
      {
         return std::invoke(std::forward<TFunc>(func), (*this)[index], std::forward<TArgs>(args)...);
      }

      /// calls <code>func(items, args...)</code> once for all items and returns the result
      template <typename TFunc, typename... TArgs>
      decltype(auto) Call4Items(TFunc && func, TArgs &&... args) const
      {
         return std::invoke(std::forward<TFunc>(func), m_items, std::forward<TArgs>(args)...);
      }

      /// calls <code>func(*this, args...)</code> and returns the result
      template <typename TFunc, typename... TArgs>
      decltype(auto) Call4Self(TFunc && func, TArgs &&... args) const
      {
         return std::invoke(std::forward<TFunc>(func), *this, std::forward<TArgs>(args)...);
      }

      /** calls <code>func(item, args...)</code> for each item, and returns a selection of the results.
          An item for which \c func throws, whatever it throws, contributes nothing.
      */
      template <typename TFunc, typename... TArgs>
      Selection Call4Each(TFunc && func, TArgs const &... args) const
      {
         Items results;
         for (std::size_t idx = 0; idx < m_items.size(); ++idx)
         {
            try
            {
               results.push_back(Node(std::invoke(func, m_items[idx], args...)));
            }
            catch (std::exception const & x)
            {
               YamlSelectDetail::LogSwallowed("Call4Each", idx, x.what());
            }
            catch (...)
            {
               YamlSelectDetail::LogSwallowed("Call4Each", idx, "unknown exception");
            }
         }
         return Derive(std::move(results));
      }

      // ----- composition
      Selection operator+(Selection const & other) const;
      Selection operator+(Items const & items) const;
      Selection operator*(long long count) const;

      Selection Derive(Items items) const;   ///< new selection over \c items, sharing root and configuration
      Selection Reroot(Node root) const;     ///< new root selection for another tree, using the same configuration

      // ----- read-only views
      std::size_t Size() const { return m_items.size(); }
      bool Empty() const { return m_items.empty(); }
      Node operator[](long long index) const;
      const_iterator begin() const { return m_items.begin(); }
      const_iterator end() const { return m_items.end(); }
      Items Tuple() const { return m_items; }

      std::string ToString() const;
      void Print(std::ostream & os) const;
      void Print() const;

      // ----- metadata
      Selection Root() const;
      ClassifierConfig const & Config() const;
      SelectionMeta Meta() const;
      bool SharesRoot(Selection const & other) const { return m_context == other.m_context; }

   private:
      Selection(std::shared_ptr<YamlSelectDetail::SelectionContext const> context, Items items);

      void CollectByKey(Node const & node, std::optional<PathArg> key, bool deep, std::size_t depth, Items & result) const;

      std::shared_ptr<YamlSelectDetail::SelectionContext const> m_context;
      Items m_items;
   };

   inline Selection operator*(long long count, Selection const & selection) { return selection * count; }

   std::ostream & operator<<(std::ostream & os, Selection const & selection);

   /// result of \ref Selection::Meta
   struct SelectionMeta
   {
      Selection root;
      ClassifierConfig config;
   };
}
