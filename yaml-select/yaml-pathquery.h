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

#include "yaml-select.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace YamlSelect
{
   /** Signature of a function callable from a PathQuery filter.

      \c first is the selection produced by the first argument (a path argument is passed as its full result,
      a literal as a one-item selection). \c rest holds the values of the remaining arguments.
   */
   using QueryFunction = std::function<Node(Selection const & first, std::vector<Node> const & rest)>;

   /** Name to function table used by \ref PathQuery

      Names are case sensitive. Registering a name that already exists replaces the previous function.
   */
   class FunctionRegistry
   {
   public:
      FunctionRegistry() = default;

      static FunctionRegistry const & Builtins();  ///< the default table, see \ref doxydoc.h for the list of functions

      FunctionRegistry & Register(std::string name, QueryFunction func);
      bool Remove(PathArg name);

      bool Contains(PathArg name) const { return Find(name) != nullptr; }
      QueryFunction const * Find(PathArg name) const;
      Node Call(PathArg name, Selection const & first, std::vector<Node> const & rest) const;
      std::vector<std::string> Names() const;
      std::size_t Size() const { return m_functions.size(); }

   private:
      std::map<std::string, QueryFunction, std::less<>> m_functions;
   };

   namespace YamlSelectDetail { struct QueryExpr; }

   /// a parsed query, see \ref PathQuery::Compile
   class CompiledQuery
   {
   public:
      Selection Evaluate(Selection const & cur) const;
      std::string const & Text() const;
      std::string Dump() const;     ///< diagnostic rendering of the parsed query as selection operator calls

   private:
      friend class PathQuery;
      struct Impl;
      std::shared_ptr<Impl const> m_impl;

      explicit CompiledQuery(std::shared_ptr<Impl const> impl) : m_impl(std::move(impl)) {}

      template <typename TFunc>
      static decltype(auto) WithQueryText(PathArg query, TFunc && func);
   };

   /** Compiler and evaluator for PathQuery strings

      \code
      PathQuery query;
      Selection authors = query(R"($.."author")", Selection(root));
      \endcode

      Lex and syntax errors are thrown from every entry point as \ref QueryException.
      The function table is copied at construction and not changed afterwards.
   */
   class PathQuery
   {
   public:
      explicit PathQuery(FunctionRegistry functions = FunctionRegistry::Builtins());

      Selection Select(PathArg query, Selection const & cur) const;
      Selection operator()(PathArg query, Selection const & cur) const { return Select(query, cur); }

      CompiledQuery Compile(PathArg query) const;

      bool Test(PathArg filter, Selection const & cur, Selection const & root) const;   ///< evaluates a filter expression for \c cur
      Node Call(PathArg call, Selection const & cur, Selection const & root) const;     ///< evaluates a single function call expression

      FunctionRegistry const & Functions() const { return *m_functions; }

   private:
      std::shared_ptr<FunctionRegistry const> m_functions;   // shared with compiled queries
   };

   Selection Select(Selection const & cur, PathArg query);  ///< runs \c query with the builtin functions
   Selection Select(Node root, PathArg query);              ///< runs \c query on a root selection for \c root with the default configuration

   EQueryError QueryValidate(PathArg query, std::string * valid = nullptr, std::size_t * errorOffs = nullptr);
}
