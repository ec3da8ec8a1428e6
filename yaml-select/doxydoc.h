namespace YamlSelect {  // allows to omit YamlSelect:: from \ref
/** \mainpage yaml-select

# Introduction

<a href="https://github.com/jbeder/yaml-cpp">yaml-cpp</a> is a C++ library for reading and writing yaml files. Its central class, \c Node, represents a document node\n
<b>yaml-select</b> selects values from a yaml-cpp tree, either with a fluent \ref Selection API, or with <b>PathQuery</b> strings:

\code
Node root = YAML::Load(R"({"books":[{"author":"A"},{"author":"B"}]})");
Selection authors = Selection(root).One("author", true);      // "A", "B"
Selection same = Select(root, R"($.."author")");              // "A", "B"
\endcode

# Selection

A \ref Selection is an ordered, immutable list of nodes from one tree. It shares the root node and the \ref ClassifierConfig
with every selection derived from it. All operators return a new selection:

   - \ref Selection::One "One"(key, deep): the value for \c key from each key-iterable item. With \c deep, all values for \c key below the items, depth-first
   - \ref Selection::All "All"(deep): like \c One, for all keys
   - \ref Selection::I "I"(selector): items of this selection by index, list of indices or \ref Slice
   - \ref Selection::El "El"(selector): like \c I, applied to the elements of each index-iterable item
   - \ref Selection::Exp "Exp"(): replaces each index-iterable item by its elements
   - \ref Selection::Filter "Filter"(predicate): the items for which \c predicate returns true. A predicate that throws rejects the item
   - \ref Selection::Call4Item "Call4Item", \ref Selection::Call4Items "Call4Items", \ref Selection::Call4Self "Call4Self": call a function, exceptions propagate
   - \ref Selection::Call4Each "Call4Each": call a function for each item. An item for which the function throws contributes nothing
   - \c +, \c *: concatenation and repetition

Indices out of range are not an error, they select nothing. An index of the wrong type is (\c EQueryError::InvalidSelectorType).

## Classifier

\ref Classify decides if a node can be iterated by key, by index, or neither. Each node has a list of shape tags (\ref ShapeTagsOf):
\c map, \c sequence, \c string, \c scalar, \c null, \c iterable, and its explicit YAML tag, if any.
\ref ClassifierConfig lists the tags that make a node key-iterable or index-iterable, and the tags that exclude it.\n
By default, maps are key-iterable, sequences are index-iterable, and strings are not split into characters.

A configuration can be read from YAML (\ref ClassifierConfig::FromYaml, \ref ClassifierConfig::LoadFile):
\code
iterable_by_index: [sequence, iterable, "!bag"]
iterable_by_key: [map]
excluded_from_index_iteration: [map, string]
excluded_from_key_iteration: []
max_depth: 256
\endcode

# PathQuery

<code>\ref PathQuery "PathQuery"()(query, selection)</code> compiles \c query and evaluates it for \c selection.

## Paths

A path starts with \c $ or \c @. At the top level, both refer to the selection the query is evaluated for.

| step                     | selection operator  |
|--------------------------|---------------------|
| <code>."key"</code>      | <code>One("key")</code> |
| <code>.."key"</code>     | <code>One("key", true)</code> |
| <code>.*</code>          | <code>All()</code> |
| <code>..*</code>         | <code>All(true)</code> |
| <code>[1]</code>, <code>[0,2]</code>, <code>[1:-1:2]</code> | <code>I(...)</code> |
| <code>.[1]</code>        | <code>El(1)</code> |
| <code>[*]</code>         | <code>Exp()</code> |
| <code>[filter]</code>    | <code>Filter(...)</code> |

Paths can be combined with \c |, which concatenates their results. A query can also be a single function call,
e.g. <code>count($.."author")</code>, selecting the result of the call.

## Filters

Inside a filter, \c @ is the item being tested, and \c $ the root of the tree.

   - literals: strings in double quotes with JSON escapes, integers, floats, \c true, \c false, \c null (keywords are case insensitive)
   - comparison: <code>= != < <= > >=</code>
   - arithmetic: <code>+ - * / %</code>, and unary minus. \c / always yields a float, \c % is floored
   - logical: \c and, \c or
   - function calls: <code>name(args...)</code>

A path on its own (the whole filter, or an operand of \c and / \c or) tests if it selects anything.
Used as an operand of any other operator, a path is reduced to its first item. If it selects nothing, the item is rejected.

## Functions

The first argument of a function is passed as a selection, all other arguments as values.
\ref FunctionRegistry::Builtins provides

   - conversion: \c toint, \c toflt, \c tostr, \c get, \c len, \c rnd, \c slice, \c replace
   - type tests: \c isnum, \c isint, \c isflt, \c isbool, \c isstr, \c isnull, \c isarr, \c isobj
   - string tests: \c startswith, \c endswith, \c instr, \c isdigit, \c isalpha, \c isalnum, \c islower, \c isupper, \c isspace, \c istitle
   - string functions: \c lower, \c upper, \c capitalize, \c title, \c trim, \c ltrim, \c rtrim, \c normalize (character classes are ASCII only)
   - selection: \c count, \c all, \c any, \c has, \c no, \c inval, \c initems, \c concat

To add functions, copy the builtin table and pass it to the \ref PathQuery constructor:
\code
FunctionRegistry functions = FunctionRegistry::Builtins();
functions.Register("double", [](Selection const & first, std::vector<Node> const &) { return Node(first[0].as<int>() * 2); });
PathQuery query(functions);
\endcode

## Error Handling

yaml-select uses \ref EQueryError codes to distinguish different error conditions, thrown as \ref QueryException.

There are three categories of errors: \ref QueryException::IsParseError "parse errors" indicate a malformed query,
and carry the position of the error. \ref QueryException::IsEvalError "evaluation errors" occur when a well-formed query
is evaluated. \ref QueryException::IsConfigError "configuration errors" are raised when loading a \ref ClassifierConfig.

Inside a filter, evaluation errors reject the item being tested. Unknown function names are always reported.

## Logging

yaml-select logs through spdlog's default logger: errors swallowed by \c Filter and \c Call4Each at debug level,
compiled queries at trace level.

*/

}
