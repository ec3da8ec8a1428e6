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

#include "yaml-select.h"
#include "yaml-select-internals.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <sstream>
#include <stdexcept>

/// namespace of yaml-select
namespace YamlSelect
{
   namespace YamlSelectDetail
   {
      /// \internal name mapping for EQueryError
      std::initializer_list<std::pair<EQueryError, char const *>> MapEQueryErrorName =
      {
         { EQueryError::OK,                     "(OK)" },
         { EQueryError::Internal,               "(internal, please report)" },
         { EQueryError::LexError,               "invalid token" },
         { EQueryError::SyntaxError,            "syntax error" },
         { EQueryError::UnexpectedEnd,          "unexpected end of query" },
         { EQueryError::InvalidSelectorType,    "invalid index selector" },
         { EQueryError::UnknownFunction,        "unknown function" },
         { EQueryError::InvalidArgument,        "invalid function argument" },
         { EQueryError::FunctionFailed,         "function failed" },
         { EQueryError::TypeMismatch,           "incompatible operand types" },
         { EQueryError::RecursionLimitExceeded, "recursion limit exceeded" },
         { EQueryError::InvalidConfig,          "invalid classifier configuration" },
      };

      /** \internal splits path at offset,
          returning everything left of [offset], assigning everything right of it to \c path.
      */
      PathArg SplitAt(PathArg & path, size_t offset)
      {
         if (offset == 0)
            return PathArg();

         if (offset >= path.size())
         {
            PathArg result = path;
            path = PathArg();
            return result;
         }

         PathArg result = path.substr(0, offset);
         path = path.substr(offset);
         return result;
      }

      void LogSwallowed(char const * operation, std::size_t index, char const * what)
      {
         spdlog::debug("yaml-select: {} dropped item #{}: {}", operation, index, what);
      }
   }

   using namespace YamlSelectDetail;


   // ----- QueryException

   QueryException::QueryException(EQueryError error, std::string detail) : m_error(error), m_detail(std::move(detail))
   {
   }

   void QueryException::SetPosition(PathArg query, std::size_t offset, std::size_t line, std::size_t column)
   {
      m_query = std::string(query);
      m_offset = offset;
      m_line = line;
      m_column = column;
      m_short.clear();
      m_detailed.clear();
   }

   /** returns a diagnostic message.
       if \c detailed is true, the message contains information about the error position and the query on multiple lines.
       Otherwise, it is a single-line message.
   */
   std::string const & QueryException::What(bool detailed) const
   {
      if (!m_short.length())
      {
         m_short = GetErrorMessage(m_error);
         if (m_detail.length())
            m_short += ": " + m_detail;
      }

      if (!detailed || m_error == EQueryError::OK)
         return m_short;

      if (m_detailed.length())
         return m_detailed;

      std::stringstream str;
      str << m_short << "\n";

      if (IsParseError())
      {
         str << "  error at query offset: " << m_offset << " (line " << m_line << ", column " << m_column << ")\n";
         str << "  valid query: " << ValidQuery() << "\n";
      }

      if (m_query.length())
         str << "  query: " << m_query << "\n";

      return m_detailed = str.str();
   }

   /** returns a generic message for the \c error given */
   std::string QueryException::GetErrorMessage(EQueryError error)
   {
      return MapValue(error, MapEQueryErrorName, "");
   }


   // ----- ClassifierConfig

   ClassifierConfig ClassifierConfig::Default()
   {
      ClassifierConfig config;
      config.iterableByIndex = { ShapeTag::Sequence, ShapeTag::Iterable };
      config.iterableByKey = { ShapeTag::Map };
      config.excludedFromIndexIteration = { ShapeTag::Map, ShapeTag::String };
      return config;
   }

   /** reads a classifier configuration from a YAML map

      Recognized keys are \c iterable_by_index, \c iterable_by_key, \c excluded_from_index_iteration,
      \c excluded_from_key_iteration (each a sequence of shape tags), and \c max_depth.
      Keys that are not present keep the value from \c base.
   */
   ClassifierConfig ClassifierConfig::FromYaml(Node const & config, ClassifierConfig base)
   {
      if (!config || config.IsNull())
         return base;

      if (!config.IsMap())
         throw QueryException(EQueryError::InvalidConfig, "configuration must be a map");

      auto ReadSet = [&](char const * key, ShapeSet & target)
      {
         Node const value = config[key];
         if (!value)
            return;
         if (value.IsNull())
         {
            target.clear();
            return;
         }
         if (!value.IsSequence())
            throw QueryException(EQueryError::InvalidConfig, std::string(key) + " must be a sequence of shape tags");

         ShapeSet tags;
         for (auto && tag : value)
            tags.insert(tag.as<std::string>());
         target.swap(tags);
      };

      try
      {
         ReadSet("iterable_by_index", base.iterableByIndex);
         ReadSet("iterable_by_key", base.iterableByKey);
         ReadSet("excluded_from_index_iteration", base.excludedFromIndexIteration);
         ReadSet("excluded_from_key_iteration", base.excludedFromKeyIteration);
         if (Node const depth = config["max_depth"])
            base.maxDepth = depth.as<std::size_t>();
      }
      catch (YAML::Exception const & x)
      {
         throw QueryException(EQueryError::InvalidConfig, x.what());
      }
      return base;
   }

   ClassifierConfig ClassifierConfig::LoadFile(std::string const & path)
   {
      Node config;
      try
      {
         config = YAML::LoadFile(path);
      }
      catch (YAML::Exception const & x)
      {
         throw QueryException(EQueryError::InvalidConfig, path + ": " + x.what());
      }

      auto result = FromYaml(config);
      spdlog::debug("yaml-select: loaded classifier configuration from {}", path);
      return result;
   }


   // ----- Type classifier

   /** returns the shape tags of \c node, see \ref ShapeTag */
   std::vector<std::string> ShapeTagsOf(Node const & node)
   {
      std::vector<std::string> tags;
      switch (KindOf(node))
      {
         case EValueKind::Map:      tags = { ShapeTag::Map, ShapeTag::Iterable }; break;
         case EValueKind::Sequence: tags = { ShapeTag::Sequence, ShapeTag::Iterable }; break;
         case EValueKind::String:   tags = { ShapeTag::String, ShapeTag::Scalar, ShapeTag::Iterable }; break;
         case EValueKind::Null:     tags = { ShapeTag::Null }; break;
         case EValueKind::Undefined: return tags;
         default:                   tags = { ShapeTag::Scalar }; break;
      }

      std::string const & tag = node.Tag();
      if (!tag.empty() && tag != "?" && tag != "!")
         tags.push_back(tag);
      return tags;
   }

   Shape Classify(Node const & node, ClassifierConfig const & config)
   {
      auto Matches = [](std::vector<std::string> const & tags, ClassifierConfig::ShapeSet const & set)
      {
         return std::any_of(tags.begin(), tags.end(), [&](std::string const & tag) { return set.count(tag) != 0; });
      };

      auto tags = ShapeTagsOf(node);
      Shape shape;
      shape.byKey = Matches(tags, config.iterableByKey) && !Matches(tags, config.excludedFromKeyIteration);
      shape.byIndex = Matches(tags, config.iterableByIndex) && !Matches(tags, config.excludedFromIndexIteration);
      return shape;
   }


   // ----- Selection

   namespace
   {
      using ResolvedSelector = std::variant<long long, std::vector<long long>, Slice>;

      /// \internal checks the selector, converting a node selector to a typed one
      ResolvedSelector Resolve(IndexSelector const & selector)
      {
         auto const & value = selector.Value();
         if (auto slice = std::get_if<Slice>(&value))
         {
            if (slice->step && *slice->step == 0)
               throw QueryException(EQueryError::InvalidSelectorType, "slice step cannot be zero");
            return *slice;
         }
         if (auto index = std::get_if<long long>(&value))
            return *index;
         if (auto indices = std::get_if<std::vector<long long>>(&value))
            return *indices;

         Node const & node = std::get<Node>(value);
         auto kind = KindOf(node);
         if (kind == EValueKind::Int)
            return AsInt(node);

         if (kind == EValueKind::Sequence)
         {
            std::vector<long long> indices;
            for (auto && el : node)
            {
               if (KindOf(el) != EValueKind::Int)
                  throw QueryException(EQueryError::InvalidSelectorType, "indices must be integers, not " + std::string(MapValue(KindOf(el), MapEValueKindName, "")));
               indices.push_back(AsInt(el));
            }
            return indices;
         }
         throw QueryException(EQueryError::InvalidSelectorType, "indices must be integers or slices, not " + std::string(MapValue(kind, MapEValueKindName, "")));
      }

      void SelectIndex(Selection::Items const & base, long long index, Selection::Items & result)
      {
         long long size = static_cast<long long>(base.size());
         if (index < 0)
            index += size;
         if (index < 0 || index >= size)
            return;     // out of range contributes nothing
         result.push_back(base[static_cast<size_t>(index)]);
      }

      void SelectSlice(Selection::Items const & base, Slice const & slice, Selection::Items & result)
      {
         long long const size = static_cast<long long>(base.size());
         long long const step = slice.step.value_or(1);

         auto Bound = [&](std::optional<long long> const & value, long long dflt)
         {
            if (!value)
               return dflt;
            long long v = *value < 0 ? *value + size : *value;
            if (step > 0)
               return std::clamp(v, 0LL, size);
            return std::clamp(v, -1LL, size - 1);
         };

         if (step > 0)
         {
            long long start = Bound(slice.start, 0);
            long long stop = Bound(slice.stop, size);
            for (long long i = start; i < stop; i += step)
               result.push_back(base[static_cast<size_t>(i)]);
         }
         else
         {
            long long start = Bound(slice.start, size - 1);
            long long stop = Bound(slice.stop, -1);
            for (long long i = start; i > stop; i += step)
               result.push_back(base[static_cast<size_t>(i)]);
         }
      }

      void SelectIndices(Selection::Items const & base, ResolvedSelector const & selector, Selection::Items & result)
      {
         switch (selector.index())
         {
            case 0:
               SelectIndex(base, std::get<long long>(selector), result);
               break;

            case 1:
               for (auto index : std::get<std::vector<long long>>(selector))
                  SelectIndex(base, index, result);
               break;

            case 2:
               SelectSlice(base, std::get<Slice>(selector), result);
               break;
         }
      }

      enum class EVerdict { Accept, Reject, Failed };

      EVerdict Verdict(Selection::Predicate const & predicate, size_t index, Selection const & cur, Selection const & root)
      {
         try
         {
            return predicate(index, cur, root) ? EVerdict::Accept : EVerdict::Reject;
         }
         catch (std::exception const & x)
         {
            LogSwallowed("Filter", index, x.what());
            return EVerdict::Failed;
         }
         catch (...)
         {
            LogSwallowed("Filter", index, "unknown exception");
            return EVerdict::Failed;
         }
      }
   }

   Selection::Selection(Node root, ClassifierConfig config)
      : m_context(std::make_shared<SelectionContext const>(SelectionContext{ root, std::move(config) }))
   {
      m_items.push_back(root);
   }

   Selection::Selection(std::shared_ptr<SelectionContext const> context, Items items) : m_context(std::move(context)), m_items(std::move(items))
   {
   }

   /** \internal collects the values of \c key (or of all keys if \c key is empty) from \c node.
       If \c deep is set, continues with every entry value and every element, in order.
   */
   void Selection::CollectByKey(Node const & node, std::optional<PathArg> key, bool deep, std::size_t depth, Items & result) const
   {
      if (depth > m_context->config.maxDepth)
         throw QueryException(EQueryError::RecursionLimitExceeded, "tree is nested deeper than " + std::to_string(m_context->config.maxDepth) + " levels");

      Shape shape = Classify(node, m_context->config);
      if (shape.byKey)
      {
         auto entries = KeyEntries(node);
         for (auto && entry : entries)
            if (!key || (entry.first.IsScalar() && entry.first.Scalar() == *key))
               result.push_back(entry.second);

         if (deep)
            for (auto && entry : entries)
               CollectByKey(entry.second, key, true, depth + 1, result);
      }
      else if (deep && shape.byIndex)
      {
         for (auto && el : IndexElements(node))
            CollectByKey(el, key, true, depth + 1, result);
      }
   }

   /** selects the value for \c key from each key-iterable item.
       With \c deep, all values for \c key anywhere below the items are selected, in depth-first order.
   */
   Selection Selection::One(PathArg key, bool deep) const
   {
      Items result;
      for (auto && item : m_items)
         CollectByKey(item, key, deep, 0, result);
      return Derive(std::move(result));
   }

   /// like \ref One, but selects the values of all keys
   Selection Selection::All(bool deep) const
   {
      Items result;
      for (auto && item : m_items)
         CollectByKey(item, std::nullopt, deep, 0, result);
      return Derive(std::move(result));
   }

   /** selects items of this selection by index, list of indices or slice.
       Indices out of range are skipped.
   */
   Selection Selection::I(IndexSelector const & selector) const
   {
      auto resolved = Resolve(selector);
      Items result;
      SelectIndices(m_items, resolved, result);
      return Derive(std::move(result));
   }

   /** like \ref I, but selects from the elements of each index-iterable item.
       Items that are not index-iterable are dropped.
   */
   Selection Selection::El(IndexSelector const & selector) const
   {
      auto resolved = Resolve(selector);
      Items result;
      for (auto && item : m_items)
      {
         if (!Classify(item, m_context->config).byIndex)
            continue;
         SelectIndices(IndexElements(item), resolved, result);
      }
      return Derive(std::move(result));
   }

   /// replaces each index-iterable item by its elements, other items are dropped
   Selection Selection::Exp() const
   {
      Items result;
      for (auto && item : m_items)
      {
         if (!Classify(item, m_context->config).byIndex)
            continue;
         for (auto && el : IndexElements(item))
            result.push_back(el);
      }
      return Derive(std::move(result));
   }

   /** selects the items for which \c predicate returns true.
       If the predicate throws, the item is not selected.
   */
   Selection Selection::Filter(Predicate const & predicate) const
   {
      Items result;
      Selection root = Root();
      for (size_t idx = 0; idx < m_items.size(); ++idx)
      {
         Selection cur(m_context, { m_items[idx] });
         if (Verdict(predicate, idx, cur, root) == EVerdict::Accept)
            result.push_back(m_items[idx]);
      }
      return Derive(std::move(result));
   }

   Selection Selection::operator+(Selection const & other) const
   {
      return *this + other.m_items;
   }

   Selection Selection::operator+(Items const & items) const
   {
      Items result(m_items);
      result.insert(result.end(), items.begin(), items.end());
      return Derive(std::move(result));
   }

   Selection Selection::operator*(long long count) const
   {
      Items result;
      for (long long i = 0; i < count; ++i)
         result.insert(result.end(), m_items.begin(), m_items.end());
      return Derive(std::move(result));
   }

   Selection Selection::Derive(Items items) const
   {
      return Selection(m_context, std::move(items));
   }

   Selection Selection::Reroot(Node root) const
   {
      return Selection(root, m_context->config);
   }

   /// returns the item at \c index, negative values count from the end. Throws \c std::out_of_range
   Node Selection::operator[](long long index) const
   {
      long long size = static_cast<long long>(m_items.size());
      if (index < 0)
         index += size;
      if (index < 0 || index >= size)
         throw std::out_of_range("selection index out of range");
      return m_items[static_cast<size_t>(index)];
   }

   std::string Selection::ToString() const
   {
      YAML::Emitter out;
      out << YAML::Flow << YAML::BeginSeq;
      for (auto && item : m_items)
         out << item;
      out << YAML::EndSeq;
      return out.c_str();
   }

   void Selection::Print(std::ostream & os) const
   {
      os << ToString() << "\n";
   }

   void Selection::Print() const
   {
      Print(std::cout);
   }

   Selection Selection::Root() const
   {
      return Selection(m_context, { m_context->root });
   }

   ClassifierConfig const & Selection::Config() const
   {
      return m_context->config;
   }

   SelectionMeta Selection::Meta() const
   {
      return SelectionMeta{ Root(), m_context->config };
   }

   std::ostream & operator<<(std::ostream & os, Selection const & selection)
   {
      return os << selection.ToString();
   }
}
