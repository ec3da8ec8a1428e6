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
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace YamlSelect
{
   namespace YamlSelectDetail
   {
      /// \internal uses the same mapping as \ref MapValue to create diagnostic for a bit mask (e.g. created by \ref BitsOf)
      template <typename T2, typename TBit, typename TMask>
      std::string MapBitMask(TMask value, std::initializer_list<std::pair<TBit, T2>> values, T2 sep = ", ")
      {
         std::stringstream result;
         bool noSep = true;
         auto Sep = [&]() -> std::stringstream & { if (!noSep) result << sep; noSep = false; return result; };
         for (auto && p : values)
         {
            TMask mask = ((TMask)1) << static_cast<TMask>(p.first);
            if (value & mask)
            {
               Sep() << p.second;
               value &= ~mask;
            }
         }
         if (value != 0)
            Sep() << "(" << std::hex << value << "h)";
         return result.str();
      }

      /// \internal name mapping for EToken
      std::initializer_list<std::pair<EToken, char const *>> MapETokenName =
      {
         { EToken::None, "end of query" },
         { EToken::Root, "'$'" },
         { EToken::Current, "'@'" },
         { EToken::Period, "'.'" },
         { EToken::DoublePeriod, "'..'" },
         { EToken::Asterisk, "'*'" },
         { EToken::OpenBracket, "'['" },
         { EToken::CloseBracket, "']'" },
         { EToken::OpenParen, "'('" },
         { EToken::CloseParen, "')'" },
         { EToken::Comma, "','" },
         { EToken::Colon, "':'" },
         { EToken::Pipe, "'|'" },
         { EToken::Plus, "'+'" },
         { EToken::Minus, "'-'" },
         { EToken::Slash, "'/'" },
         { EToken::Percent, "'%'" },
         { EToken::Equal, "'='" },
         { EToken::NotEqual, "'!='" },
         { EToken::Less, "'<'" },
         { EToken::LessEqual, "'<='" },
         { EToken::Greater, "'>'" },
         { EToken::GreaterEqual, "'>='" },
         { EToken::String, "string" },
         { EToken::Integer, "integer" },
         { EToken::Float, "float" },
         { EToken::Identifier, "function name" },
         { EToken::And, "and" },
         { EToken::Or, "or" },
         { EToken::True, "true" },
         { EToken::False, "false" },
         { EToken::Null, "null" },
      };

      namespace
      {
         bool IEquals(PathArg a, char const * b)
         {
            size_t i = 0;
            for (; i < a.size() && b[i]; ++i)
               if (std::tolower((unsigned char)a[i]) != b[i])
                  return false;
            return i == a.size() && !b[i];
         }

         void AppendUtf8(std::string & s, uint32_t cp)
         {
            if (cp < 0x80)
               s += char(cp);
            else if (cp < 0x800)
            {
               s += char(0xC0 | (cp >> 6));
               s += char(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
               s += char(0xE0 | (cp >> 12));
               s += char(0x80 | ((cp >> 6) & 0x3F));
               s += char(0x80 | (cp & 0x3F));
            }
            else
            {
               s += char(0xF0 | (cp >> 18));
               s += char(0x80 | ((cp >> 12) & 0x3F));
               s += char(0x80 | ((cp >> 6) & 0x3F));
               s += char(0x80 | (cp & 0x3F));
            }
         }

         bool ReadHex4(PathArg s, size_t pos, uint32_t & value)
         {
            if (pos + 4 > s.size())
               return false;
            value = 0;
            for (size_t i = pos; i < pos + 4; ++i)
            {
               char c = s[i];
               value <<= 4;
               if (c >= '0' && c <= '9')       value |= c - '0';
               else if (c >= 'a' && c <= 'f')  value |= c - 'a' + 10;
               else if (c >= 'A' && c <= 'F')  value |= c - 'A' + 10;
               else
                  return false;
            }
            return true;
         }
      }


      // ----- Lexer

      Lexer::Lexer(PathArg query) : m_rpath(query), m_query(query)
      {
      }

      /// \internal skips whitespace, keeping track of line breaks
      void Lexer::SkipWS()
      {
         auto ws = Split(m_rpath, [](char c) { return isascii(c) && isspace(c); });
         size_t start = ScanOffset() - ws.size();
         for (size_t i = 0; i < ws.size(); ++i)
         {
            if (ws[i] == '\n')
            {
               ++m_line;
               m_lineStart = start + i + 1;
            }
         }
      }

      /// \internal Helper used by \c NextToken etc. to set m_curToken, removes \c text from the unscanned query
      TokenData const & Lexer::SetToken(EToken id, size_t offset, PathArg text)
      {
         SplitAt(m_rpath, text.size());
         m_curToken = TokenData();
         m_curToken.id = id;
         m_curToken.text = text;
         m_curToken.offset = offset;
         m_curToken.line = m_line;
         m_curToken.column = offset - m_lineStart + 1;
         return m_curToken;
      }

      void Lexer::Fail(std::string detail, size_t offset) const
      {
         QueryException x(EQueryError::LexError, std::move(detail));
         x.SetPosition(m_query, offset, m_line, offset - m_lineStart + 1);
         throw x;
      }

      /** \internal removes the next token from the query and returns it. Returns a \c EToken::None token at the end of the query. */
      TokenData const & Lexer::NextToken()
      {
         SkipWS();
         size_t const offset = ScanOffset();
         if (m_rpath.empty())
            return SetToken(EToken::None, offset, PathArg());

         char head = m_rpath[0];
         char next = m_rpath.size() > 1 ? m_rpath[1] : 0;

         // two-char operators
         EToken t = EToken::None;
         if (head == '.' && next == '.')        t = EToken::DoublePeriod;
         else if (head == '!' && next == '=')   t = EToken::NotEqual;
         else if (head == '<' && next == '=')   t = EToken::LessEqual;
         else if (head == '>' && next == '=')   t = EToken::GreaterEqual;

         if (t != EToken::None)
            return SetToken(t, offset, m_rpath.substr(0, 2));

         if (head == '.' && isdigit((unsigned char)next))
            return ScanNumber(offset), m_curToken;

         // single-char special tokens
         t = MapValue(head, {
            { '$', EToken::Root },
            { '@', EToken::Current },
            { '.', EToken::Period },
            { '*', EToken::Asterisk },
            { '[', EToken::OpenBracket },
            { ']', EToken::CloseBracket },
            { '(', EToken::OpenParen },
            { ')', EToken::CloseParen },
            { ',', EToken::Comma },
            { ':', EToken::Colon },
            { '|', EToken::Pipe },
            { '+', EToken::Plus },
            { '-', EToken::Minus },
            { '/', EToken::Slash },
            { '%', EToken::Percent },
            { '=', EToken::Equal },
            { '<', EToken::Less },
            { '>', EToken::Greater },
            }, EToken::None);

         if (t != EToken::None)
            return SetToken(t, offset, m_rpath.substr(0, 1));

         if (head == '"')
            return ScanString(offset), m_curToken;

         if (isdigit((unsigned char)head))
            return ScanNumber(offset), m_curToken;

         if (isascii(head) && isalpha(head))
         {
            PathArg rest = m_rpath;
            auto word = Split(rest, [](char c) { return isascii(c) && (isalnum(c) || c == '_'); });
            t = EToken::Identifier;
            if (IEquals(word, "and"))        t = EToken::And;
            else if (IEquals(word, "or"))    t = EToken::Or;
            else if (IEquals(word, "true"))  t = EToken::True;
            else if (IEquals(word, "false")) t = EToken::False;
            else if (IEquals(word, "null"))  t = EToken::Null;
            return SetToken(t, offset, word);
         }

         if (head == '!')
            Fail("'!' must be followed by '='", offset);
         Fail(std::string("unexpected character '") + head + "'", offset);
      }

      /// \internal scans a double quoted string with JSON escapes
      void Lexer::ScanString(size_t offset)
      {
         std::string value;
         size_t pos = 1;
         for (;;)
         {
            if (pos >= m_rpath.size())
               Fail("unterminated string", offset);

            char c = m_rpath[pos];
            if (c == '"')
               break;

            if (c != '\\')
            {
               value += c;
               ++pos;
               continue;
            }

            if (pos + 1 >= m_rpath.size())
               Fail("unterminated string", offset);

            char esc = m_rpath[pos + 1];
            size_t escOffset = offset + pos;
            pos += 2;
            switch (esc)
            {
               case '"':  value += '"'; break;
               case '\\': value += '\\'; break;
               case '/':  value += '/'; break;
               case 'b':  value += '\b'; break;
               case 'f':  value += '\f'; break;
               case 'n':  value += '\n'; break;
               case 'r':  value += '\r'; break;
               case 't':  value += '\t'; break;
               case 'u':
               {
                  uint32_t cp = 0;
                  if (!ReadHex4(m_rpath, pos, cp))
                     Fail("invalid \\u escape", escOffset);
                  pos += 4;

                  // surrogate pair
                  uint32_t low = 0;
                  if (cp >= 0xD800 && cp < 0xDC00 && pos + 6 <= m_rpath.size() && m_rpath[pos] == '\\' && m_rpath[pos + 1] == 'u'
                     && ReadHex4(m_rpath, pos + 2, low) && low >= 0xDC00 && low < 0xE000)
                  {
                     cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                     pos += 6;
                  }
                  AppendUtf8(value, cp);
                  break;
               }
               default:
                  Fail(std::string("invalid escape sequence '\\") + esc + "'", escOffset);
            }
         }

         SetToken(EToken::String, offset, m_rpath.substr(0, pos + 1));
         m_curToken.value = std::move(value);
      }

      /// \internal scans an integer (\c 12) or float (\c 1.5, \c .5, \c 1e3) literal
      void Lexer::ScanNumber(size_t offset)
      {
         auto IsDigit = [&](size_t pos) { return pos < m_rpath.size() && isdigit((unsigned char)m_rpath[pos]); };

         size_t pos = 0;
         bool isFloat = false;
         while (IsDigit(pos))
            ++pos;

         if (pos < m_rpath.size() && m_rpath[pos] == '.' && IsDigit(pos + 1))
         {
            isFloat = true;
            ++pos;
            while (IsDigit(pos))
               ++pos;
         }

         if (pos < m_rpath.size() && (m_rpath[pos] == 'e' || m_rpath[pos] == 'E'))
         {
            size_t exp = pos + 1;
            if (exp < m_rpath.size() && (m_rpath[exp] == '+' || m_rpath[exp] == '-'))
               ++exp;
            if (!IsDigit(exp))
               Fail("invalid number", offset);
            isFloat = true;
            pos = exp;
            while (IsDigit(pos))
               ++pos;
         }

         PathArg text = m_rpath.substr(0, pos);
         if (isFloat)
         {
            std::string s(text);
            double number = std::strtod(s.c_str(), nullptr);
            SetToken(EToken::Float, offset, text);
            m_curToken.number = number;
            return;
         }

         long long integer = 0;
         auto result = std::from_chars(text.data(), text.data() + text.size(), integer);
         if (result.ec != std::errc())
            Fail("integer out of range", offset);

         SetToken(EToken::Integer, offset, text);
         m_curToken.integer = integer;
      }

      /** \internal scans the complete query. The last token is always \c EToken::None */
      std::vector<TokenData> Lexer::Tokenize()
      {
         std::vector<TokenData> tokens;
         do
            tokens.push_back(NextToken());
         while (tokens.back().id != EToken::None);
         return tokens;
      }


      // ----- Parser

      namespace
      {
         uint64_t const ValidAnchor = BitsOf({ EToken::Root, EToken::Current });
         uint64_t const ValidAfterPeriod = BitsOf({ EToken::String, EToken::Asterisk, EToken::OpenBracket });
         uint64_t const ValidAfterDoublePeriod = BitsOf({ EToken::String, EToken::Asterisk });
         uint64_t const ValidFactor = BitsOf({ EToken::Minus, EToken::Root, EToken::Current, EToken::String, EToken::Integer, EToken::Float,
                                               EToken::True, EToken::False, EToken::Null, EToken::Identifier, EToken::OpenParen });

         template <typename T>
         FilterPtr MakeExpr(size_t offset, T node)
         {
            auto expr = std::make_unique<FilterExpr>();
            expr->node = std::move(node);
            expr->offset = offset;
            return expr;
         }

         std::optional<ECompareOp> CompareOp(EToken id)
         {
            switch (id)
            {
               case EToken::Equal:        return ECompareOp::Equal;
               case EToken::NotEqual:     return ECompareOp::NotEqual;
               case EToken::Less:         return ECompareOp::Less;
               case EToken::LessEqual:    return ECompareOp::LessEqual;
               case EToken::Greater:      return ECompareOp::Greater;
               case EToken::GreaterEqual: return ECompareOp::GreaterEqual;
               default:                   return std::nullopt;
            }
         }
      }

      /// \internal limits the recursion depth of the parser
      class Parser::NestingGuard
      {
      public:
         explicit NestingGuard(Parser & parser) : m_parser(parser)
         {
            if (m_parser.m_nesting >= MaxNesting)
               m_parser.FailWith(m_parser.Peek(), EQueryError::SyntaxError, "expression nested too deeply");
            ++m_parser.m_nesting;
         }
         ~NestingGuard() { --m_parser.m_nesting; }

         NestingGuard(NestingGuard const &) = delete;
         NestingGuard & operator=(NestingGuard const &) = delete;

      private:
         Parser & m_parser;
      };

      Parser::Parser(PathArg query) : m_query(query)
      {
         m_tokens = Lexer(query).Tokenize();
      }

      TokenData const & Parser::Peek(size_t ahead) const
      {
         return m_tokens[std::min(m_pos + ahead, m_tokens.size() - 1)];
      }

      TokenData const & Parser::Next()
      {
         TokenData const & token = Peek();
         if (m_pos < m_tokens.size() - 1)
            ++m_pos;
         return token;
      }

      bool Parser::Accept(EToken id)
      {
         if (Peek().id != id)
            return false;
         Next();
         return true;
      }

      /// \internal consumes the next token if it is one of \c validTokens, fails otherwise
      TokenData const & Parser::Expect(uint64_t validTokens)
      {
         if (!BitsContain(validTokens, Peek().id))
            Fail(Peek(), validTokens);
         return Next();
      }

      void Parser::ExpectEnd()
      {
         if (Peek().id != EToken::None)
            Fail(Peek(), BitsOf({ EToken::None }));
      }

      void Parser::Fail(TokenData const & at, uint64_t validTokens) const
      {
         std::string detail;
         if (at.id == EToken::None)
            detail = "expected " + MapBitMask(validTokens, MapETokenName, " or ");
         else
         {
            detail = "unexpected '" + std::string(at.text) + "'";
            if (validTokens)
               detail += ", expected " + MapBitMask(validTokens, MapETokenName, " or ");
         }
         FailWith(at, at.id == EToken::None ? EQueryError::UnexpectedEnd : EQueryError::SyntaxError, detail);
      }

      void Parser::FailWith(TokenData const & at, EQueryError error, std::string detail) const
      {
         QueryException x(error, std::move(detail));
         x.SetPosition(m_query, at.offset, at.line, at.column);
         throw x;
      }

      /** \internal parses a complete query: a union of paths, or a single function call */
      QueryExpr Parser::ParseQuery()
      {
         QueryExpr query;
         if (Peek().id == EToken::Identifier && Peek(1).id == EToken::OpenParen)
         {
            auto call = ParseCallExpr();
            auto & callNode = std::get<FilterExpr::Call>(call->node);

            PathExpr path;
            path.anchor = EAnchor::Current;
            path.steps.emplace_back(StepCall{ std::move(callNode.name), std::move(callNode.args) });
            query.path.paths.push_back(std::move(path));
         }
         else
            query.path = ParseUnion();

         ExpectEnd();
         return query;
      }

      FilterPtr Parser::ParseFilter()
      {
         auto expr = ParseOr();
         ExpectEnd();
         return expr;
      }

      FilterPtr Parser::ParseCall()
      {
         if (Peek().id != EToken::Identifier)
            Fail(Peek(), BitsOf({ EToken::Identifier }));
         auto expr = ParseCallExpr();
         ExpectEnd();
         return expr;
      }

      PathUnion Parser::ParseUnion()
      {
         PathUnion result;
         result.paths.push_back(ParsePath());
         while (Accept(EToken::Pipe))
            result.paths.push_back(ParsePath());
         return result;
      }

      PathExpr Parser::ParsePath()
      {
         NestingGuard guard(*this);

         PathExpr path;
         path.anchor = Expect(ValidAnchor).id == EToken::Root ? EAnchor::Root : EAnchor::Current;

         for (;;)
         {
            switch (Peek().id)
            {
               case EToken::Period:
               {
                  Next();
                  auto const & token = Expect(ValidAfterPeriod);
                  if (token.id == EToken::String)
                     path.steps.emplace_back(StepKey{ token.value, false });
                  else if (token.id == EToken::Asterisk)
                     path.steps.emplace_back(StepAll{ false });
                  else
                  {
                     auto selector = ParseSelector();
                     Expect(BitsOf({ EToken::CloseBracket }));
                     path.steps.emplace_back(StepElement{ std::move(selector) });
                  }
                  break;
               }

               case EToken::DoublePeriod:
               {
                  Next();
                  auto const & token = Expect(ValidAfterDoublePeriod);
                  if (token.id == EToken::String)
                     path.steps.emplace_back(StepKey{ token.value, true });
                  else
                     path.steps.emplace_back(StepAll{ true });
                  break;
               }

               case EToken::OpenBracket:
               {
                  Next();
                  if (Peek().id == EToken::Asterisk && Peek(1).id == EToken::CloseBracket)
                  {
                     Next();
                     path.steps.emplace_back(StepExpand{});
                  }
                  else if (IsSelectorAhead())
                     path.steps.emplace_back(StepIndex{ ParseSelector() });
                  else
                     path.steps.emplace_back(StepFilter{ ParseOr() });
                  Expect(BitsOf({ EToken::CloseBracket }));
                  break;
               }

               default:
                  return path;
            }
         }
      }

      /** \internal checks if the tokens after an open bracket form an index selector.
          Otherwise, the bracket holds a filter.
      */
      bool Parser::IsSelectorAhead() const
      {
         size_t p = 0;
         auto Id = [&] { return Peek(p).id; };
         auto SkipInt = [&]
         {
            size_t q = p;
            if (Peek(q).id == EToken::Minus)
               ++q;
            if (Peek(q).id != EToken::Integer)
               return false;
            p = q + 1;
            return true;
         };

         if (SkipInt())
         {
            if (Id() == EToken::CloseBracket)
               return true;
            if (Id() == EToken::Comma)
            {
               while (Id() == EToken::Comma)
               {
                  ++p;
                  if (!SkipInt())
                     return false;
               }
               return Id() == EToken::CloseBracket;
            }
         }

         if (Id() != EToken::Colon)
            return false;
         ++p;
         SkipInt();
         if (Id() == EToken::Colon)
         {
            ++p;
            SkipInt();
         }
         return Id() == EToken::CloseBracket;
      }

      /// \internal <code>n (',' n)*</code> or <code>n? ':' n? (':' n?)?</code>
      IndexSelector Parser::ParseSelector()
      {
         auto first = ParseOptionalInt();
         if (first && Peek().id != EToken::Colon)
         {
            if (Peek().id != EToken::Comma)
               return IndexSelector(*first);

            std::vector<long long> indices{ *first };
            while (Accept(EToken::Comma))
               indices.push_back(ParseInt());
            return IndexSelector(std::move(indices));
         }

         Expect(BitsOf({ EToken::Colon }));
         Slice slice;
         slice.start = first;
         slice.stop = ParseOptionalInt();
         if (Accept(EToken::Colon))
            slice.step = ParseOptionalInt();
         return IndexSelector(slice);
      }

      std::optional<long long> Parser::ParseOptionalInt()
      {
         if (Peek().id != EToken::Minus && Peek().id != EToken::Integer)
            return std::nullopt;
         return ParseInt();
      }

      long long Parser::ParseInt()
      {
         bool negative = Accept(EToken::Minus);
         long long value = Expect(BitsOf({ EToken::Integer })).integer;
         return negative ? -value : value;
      }

      FilterPtr Parser::ParseOr()
      {
         auto left = ParseAnd();
         while (Peek().id == EToken::Or)
         {
            size_t offset = Next().offset;
            left = MakeExpr(offset, FilterExpr::Logical{ ELogicalOp::Or, std::move(left), ParseAnd() });
         }
         return left;
      }

      FilterPtr Parser::ParseAnd()
      {
         auto left = ParseComparison();
         while (Peek().id == EToken::And)
         {
            size_t offset = Next().offset;
            left = MakeExpr(offset, FilterExpr::Logical{ ELogicalOp::And, std::move(left), ParseComparison() });
         }
         return left;
      }

      /// \internal comparisons do not chain, <code>a < b < c</code> is a syntax error
      FilterPtr Parser::ParseComparison()
      {
         auto left = ParseAdditive();
         auto op = CompareOp(Peek().id);
         if (!op)
            return left;

         size_t offset = Next().offset;
         return MakeExpr(offset, FilterExpr::Compare{ *op, std::move(left), ParseAdditive() });
      }

      FilterPtr Parser::ParseAdditive()
      {
         auto left = ParseTerm();
         while (Peek().id == EToken::Plus || Peek().id == EToken::Minus)
         {
            auto op = Peek().id == EToken::Plus ? EArithOp::Add : EArithOp::Subtract;
            size_t offset = Next().offset;
            left = MakeExpr(offset, FilterExpr::Arith{ op, std::move(left), ParseTerm() });
         }
         return left;
      }

      FilterPtr Parser::ParseTerm()
      {
         auto left = ParseFactor();
         for (;;)
         {
            EArithOp op;
            switch (Peek().id)
            {
               case EToken::Asterisk: op = EArithOp::Multiply; break;
               case EToken::Slash:    op = EArithOp::Divide; break;
               case EToken::Percent:  op = EArithOp::Modulo; break;
               default:               return left;
            }
            size_t offset = Next().offset;
            left = MakeExpr(offset, FilterExpr::Arith{ op, std::move(left), ParseFactor() });
         }
      }

      FilterPtr Parser::ParseFactor()
      {
         NestingGuard guard(*this);

         auto const & token = Peek();
         switch (token.id)
         {
            case EToken::Minus:
               Next();
               return MakeExpr(token.offset, FilterExpr::Negate{ ParseFactor() });

            case EToken::Root:
            case EToken::Current:
               return MakeExpr(token.offset, FilterExpr::PathRef{ ParseUnion() });

            case EToken::String:  Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeString(token.value) });
            case EToken::Integer: Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeInt(token.integer) });
            case EToken::Float:   Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeFloat(token.number) });
            case EToken::True:    Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeBool(true) });
            case EToken::False:   Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeBool(false) });
            case EToken::Null:    Next(); return MakeExpr(token.offset, FilterExpr::Literal{ MakeNull() });

            case EToken::Identifier:
               return ParseCallExpr();

            case EToken::OpenParen:
            {
               Next();
               auto expr = ParseOr();
               Expect(BitsOf({ EToken::CloseParen }));
               return expr;
            }

            default:
               Fail(token, ValidFactor);
         }
      }

      /// \internal <code>name '(' (expr (',' expr)*)? ')'</code>
      FilterPtr Parser::ParseCallExpr()
      {
         auto const & name = Expect(BitsOf({ EToken::Identifier }));
         Expect(BitsOf({ EToken::OpenParen }));

         FilterExpr::Call call{ std::string(name.text), {} };
         if (!Accept(EToken::CloseParen))
         {
            do
               call.args.push_back(ParseOr());
            while (Accept(EToken::Comma));
            Expect(BitsOf({ EToken::CloseParen }));
         }
         return MakeExpr(name.offset, std::move(call));
      }


      // ----- Dump

      namespace
      {
         std::string Quote(std::string const & s)
         {
            std::string result = "\"";
            for (char c : s)
            {
               if (c == '"' || c == '\\')
                  result += '\\';
               result += c;
            }
            return result + "\"";
         }

         std::string DumpArgs(std::vector<FilterPtr> const & args)
         {
            std::string result;
            for (auto && arg : args)
            {
               if (!result.empty())
                  result += ", ";
               result += Dump(*arg);
            }
            return result;
         }

         std::string DumpPath(PathExpr const & path)
         {
            std::string result = path.anchor == EAnchor::Root ? "$" : "@";
            for (auto && step : path.steps)
            {
               if (auto key = std::get_if<StepKey>(&step))
                  result += ".one(" + Quote(key->name) + (key->deep ? ", deep)" : ")");
               else if (auto all = std::get_if<StepAll>(&step))
                  result += all->deep ? ".all(deep)" : ".all()";
               else if (auto index = std::get_if<StepIndex>(&step))
                  result += ".i(" + Dump(index->selector) + ")";
               else if (auto element = std::get_if<StepElement>(&step))
                  result += ".el(" + Dump(element->selector) + ")";
               else if (std::holds_alternative<StepExpand>(step))
                  result += ".exp()";
               else if (auto filter = std::get_if<StepFilter>(&step))
                  result += ".filter(" + Dump(*filter->expr) + ")";
               else if (auto call = std::get_if<StepCall>(&step))
                  result += ".call4self(" + call->name + "(" + DumpArgs(call->args) + "))";
            }
            return result;
         }

         char const * OpText(ECompareOp op)
         {
            return MapValue(op, {
               { ECompareOp::Equal, "=" },
               { ECompareOp::NotEqual, "!=" },
               { ECompareOp::Less, "<" },
               { ECompareOp::LessEqual, "<=" },
               { ECompareOp::Greater, ">" },
               { ECompareOp::GreaterEqual, ">=" },
               }, "?");
         }

         char const * OpText(EArithOp op)
         {
            return MapValue(op, {
               { EArithOp::Add, "+" },
               { EArithOp::Subtract, "-" },
               { EArithOp::Multiply, "*" },
               { EArithOp::Divide, "/" },
               { EArithOp::Modulo, "%" },
               }, "?");
         }
      }

      /** \internal renders a parsed path as the equivalent chain of selection operators, e.g.
          <code>$.one("a").i(0)</code> for <code>$."a"[0]</code>. Used for tracing and in tests.
      */
      std::string Dump(PathUnion const & path)
      {
         std::string result;
         for (auto && p : path.paths)
         {
            if (!result.empty())
               result += " | ";
            result += DumpPath(p);
         }
         return result;
      }

      std::string Dump(FilterExpr const & expr)
      {
         auto const & node = expr.node;
         if (auto ref = std::get_if<FilterExpr::PathRef>(&node))
            return Dump(ref->path);

         if (auto literal = std::get_if<FilterExpr::Literal>(&node))
         {
            switch (KindOf(literal->value))
            {
               case EValueKind::String: return Quote(literal->value.Scalar());
               case EValueKind::Null:   return "null";
               default:                 return literal->value.Scalar();
            }
         }

         if (auto cmp = std::get_if<FilterExpr::Compare>(&node))
            return "(" + Dump(*cmp->left) + " " + OpText(cmp->op) + " " + Dump(*cmp->right) + ")";

         if (auto arith = std::get_if<FilterExpr::Arith>(&node))
            return "(" + Dump(*arith->left) + " " + OpText(arith->op) + " " + Dump(*arith->right) + ")";

         if (auto negate = std::get_if<FilterExpr::Negate>(&node))
            return "-" + Dump(*negate->operand);

         if (auto logical = std::get_if<FilterExpr::Logical>(&node))
            return "(" + Dump(*logical->left) + (logical->op == ELogicalOp::And ? " and " : " or ") + Dump(*logical->right) + ")";

         auto const & call = std::get<FilterExpr::Call>(node);
         return call.name + "(" + DumpArgs(call.args) + ")";
      }

      std::string Dump(IndexSelector const & selector)
      {
         auto const & value = selector.Value();
         if (auto index = std::get_if<long long>(&value))
            return std::to_string(*index);

         if (auto indices = std::get_if<std::vector<long long>>(&value))
         {
            std::string result;
            for (auto i : *indices)
               result += (result.empty() ? "[" : ",") + std::to_string(i);
            return result + "]";
         }

         if (auto slice = std::get_if<Slice>(&value))
         {
            auto Bound = [](std::optional<long long> const & v) { return v ? std::to_string(*v) : std::string(); };
            std::string result = Bound(slice->start) + ":" + Bound(slice->stop);
            if (slice->step)
               result += ":" + Bound(slice->step);
            return result;
         }

         YAML::Emitter out;
         out << YAML::Flow << std::get<Node>(value);
         return out.c_str();
      }


      // ----- Evaluator

      /** \internal evaluates a parsed query for \c cur. At the top level, \c $ and \c @ both refer to \c cur */
      Selection Evaluator::EvalQuery(QueryExpr const & query, Selection const & cur) const
      {
         CheckFunctions(query.path);
         return EvalUnion(query.path, cur, cur, 0);
      }

      bool Evaluator::EvalPredicate(FilterExpr const & expr, Selection const & cur, Selection const & root) const
      {
         CheckFunctions(expr);
         return EvalCondition(expr, cur, root, 0).value_or(false);
      }

      Node Evaluator::EvalCall(FilterExpr const & expr, Selection const & cur, Selection const & root) const
      {
         CheckFunctions(expr);
         auto const & call = std::get<FilterExpr::Call>(expr.node);
         auto result = CallFunction(call.name, call.args, cur, root, 0);
         if (!result)
            throw QueryException(EQueryError::InvalidArgument, call.name + ": an argument selects nothing");
         return *result;
      }

      /** \internal function names are resolved before evaluation, so that an unknown function is reported
          even if it is only used in a filter.
      */
      void Evaluator::CheckFunctions(PathUnion const & path) const
      {
         for (auto && p : path.paths)
         {
            for (auto && step : p.steps)
            {
               if (auto filter = std::get_if<StepFilter>(&step))
                  CheckFunctions(*filter->expr);
               else if (auto call = std::get_if<StepCall>(&step))
               {
                  if (!m_functions.Contains(call->name))
                     throw QueryException(EQueryError::UnknownFunction, call->name);
                  for (auto && arg : call->args)
                     CheckFunctions(*arg);
               }
            }
         }
      }

      void Evaluator::CheckFunctions(FilterExpr const & expr) const
      {
         auto const & node = expr.node;
         if (auto ref = std::get_if<FilterExpr::PathRef>(&node))
            CheckFunctions(ref->path);
         else if (auto cmp = std::get_if<FilterExpr::Compare>(&node))
         {
            CheckFunctions(*cmp->left);
            CheckFunctions(*cmp->right);
         }
         else if (auto arith = std::get_if<FilterExpr::Arith>(&node))
         {
            CheckFunctions(*arith->left);
            CheckFunctions(*arith->right);
         }
         else if (auto negate = std::get_if<FilterExpr::Negate>(&node))
            CheckFunctions(*negate->operand);
         else if (auto logical = std::get_if<FilterExpr::Logical>(&node))
         {
            CheckFunctions(*logical->left);
            CheckFunctions(*logical->right);
         }
         else if (auto call = std::get_if<FilterExpr::Call>(&node))
         {
            if (!m_functions.Contains(call->name))
               throw QueryException(EQueryError::UnknownFunction, call->name);
            for (auto && arg : call->args)
               CheckFunctions(*arg);
         }
      }

      void Evaluator::CheckDepth(size_t depth, Selection const & cur) const
      {
         if (depth > cur.Config().maxDepth)
            throw QueryException(EQueryError::RecursionLimitExceeded, "filters nested deeper than " + std::to_string(cur.Config().maxDepth) + " levels");
      }

      Selection Evaluator::EvalUnion(PathUnion const & path, Selection const & cur, Selection const & root, size_t depth) const
      {
         Selection result = EvalPath(path.paths.front(), cur, root, depth);
         for (size_t i = 1; i < path.paths.size(); ++i)
            result = result + EvalPath(path.paths[i], cur, root, depth);
         return result;
      }

      Selection Evaluator::EvalPath(PathExpr const & path, Selection const & cur, Selection const & root, size_t depth) const
      {
         CheckDepth(depth, cur);
         Selection current = path.anchor == EAnchor::Root ? root : cur;
         for (auto && step : path.steps)
            current = ApplyStep(step, current, root, depth);
         return current;
      }

      /// \internal maps one path step onto one selection operator
      Selection Evaluator::ApplyStep(tStep const & step, Selection const & current, Selection const & root, size_t depth) const
      {
         if (auto key = std::get_if<StepKey>(&step))
            return current.One(key->name, key->deep);

         if (auto all = std::get_if<StepAll>(&step))
            return current.All(all->deep);

         if (auto index = std::get_if<StepIndex>(&step))
            return current.I(index->selector);

         if (auto element = std::get_if<StepElement>(&step))
            return current.El(element->selector);

         if (std::holds_alternative<StepExpand>(step))
            return current.Exp();

         if (auto filter = std::get_if<StepFilter>(&step))
         {
            FilterExpr const & expr = *filter->expr;
            return current.Filter([&](size_t, Selection const & item, Selection const & absRoot)
            {
               return EvalCondition(expr, item, absRoot, depth + 1).value_or(false);
            });
         }

         auto const & call = std::get<StepCall>(step);
         auto result = current.Call4Self([&](Selection const & self)
         {
            return CallFunction(call.name, call.args, self, root, depth);
         });
         if (!result)
            return current.Derive({});
         return current.Derive({ *result });
      }

      /** \internal evaluates \c expr in boolean context. A path tests for a non-empty result.
          Returns \c std::nullopt if an operand is empty, which rejects the candidate.
      */
      std::optional<bool> Evaluator::EvalCondition(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const
      {
         if (auto ref = std::get_if<FilterExpr::PathRef>(&expr.node))
            return !EvalUnion(ref->path, cur, root, depth).Empty();

         if (auto logical = std::get_if<FilterExpr::Logical>(&expr.node))
         {
            auto left = EvalCondition(*logical->left, cur, root, depth);
            if (!left)
               return std::nullopt;
            if (logical->op == ELogicalOp::And ? !*left : *left)
               return left;
            return EvalCondition(*logical->right, cur, root, depth);
         }

         auto value = EvalValue(expr, cur, root, depth);
         if (!value)
            return std::nullopt;
         return IsTruthy(*value);
      }

      /// \internal evaluates \c expr to a single value, a path is reduced to its first item
      std::optional<Node> Evaluator::EvalValue(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const
      {
         auto const & node = expr.node;
         if (auto ref = std::get_if<FilterExpr::PathRef>(&node))
         {
            auto selection = EvalUnion(ref->path, cur, root, depth);
            if (selection.Empty())
               return std::nullopt;
            return selection[0];
         }

         if (auto literal = std::get_if<FilterExpr::Literal>(&node))
            return literal->value;

         if (auto cmp = std::get_if<FilterExpr::Compare>(&node))
         {
            auto left = EvalValue(*cmp->left, cur, root, depth);
            if (!left)
               return std::nullopt;
            auto right = EvalValue(*cmp->right, cur, root, depth);
            if (!right)
               return std::nullopt;
            return MakeBool(Compare(cmp->op, *left, *right));
         }

         if (auto arith = std::get_if<FilterExpr::Arith>(&node))
         {
            auto left = EvalValue(*arith->left, cur, root, depth);
            if (!left)
               return std::nullopt;
            auto right = EvalValue(*arith->right, cur, root, depth);
            if (!right)
               return std::nullopt;
            return Arithmetic(arith->op, *left, *right);
         }

         if (auto negate = std::get_if<FilterExpr::Negate>(&node))
         {
            auto operand = EvalValue(*negate->operand, cur, root, depth);
            if (!operand)
               return std::nullopt;
            return Negate(*operand);
         }

         if (std::holds_alternative<FilterExpr::Logical>(node))
         {
            auto condition = EvalCondition(expr, cur, root, depth);
            if (!condition)
               return std::nullopt;
            return MakeBool(*condition);
         }

         auto const & call = std::get<FilterExpr::Call>(node);
         return CallFunction(call.name, call.args, cur, root, depth);
      }

      /// \internal the first function argument is passed as a selection: a path with its full result, any other value as a single item
      Selection Evaluator::EvalArgument(FilterExpr const & expr, Selection const & cur, Selection const & root, size_t depth) const
      {
         if (auto ref = std::get_if<FilterExpr::PathRef>(&expr.node))
            return EvalUnion(ref->path, cur, root, depth + 1);

         auto value = EvalValue(expr, cur, root, depth + 1);
         if (!value)
            return cur.Derive({});
         return cur.Derive({ *value });
      }

      /** \internal calls a registered function. Without arguments, the function receives \c cur as first argument.
          Exceptions other than \ref QueryException thrown by the function are reported as \c EQueryError::FunctionFailed.
      */
      std::optional<Node> Evaluator::CallFunction(PathArg name, std::vector<FilterPtr> const & args, Selection const & cur, Selection const & root, size_t depth) const
      {
         auto function = m_functions.Find(name);
         if (!function)
            throw QueryException(EQueryError::UnknownFunction, std::string(name));

         Selection first = args.empty() ? cur : EvalArgument(*args.front(), cur, root, depth);

         std::vector<Node> rest;
         for (size_t i = 1; i < args.size(); ++i)
         {
            auto value = EvalValue(*args[i], cur, root, depth + 1);
            if (!value)
               return std::nullopt;
            rest.push_back(*value);
         }

         try
         {
            return (*function)(first, rest);
         }
         catch (QueryException const &)
         {
            throw;
         }
         catch (std::exception const & x)
         {
            throw QueryException(EQueryError::FunctionFailed, std::string(name) + ": " + x.what());
         }
      }
   }

   using namespace YamlSelectDetail;


   // ----- CompiledQuery

   struct CompiledQuery::Impl
   {
      std::string text;
      QueryExpr expr;
      std::shared_ptr<FunctionRegistry const> functions;
   };

   /// \internal runs \c func, attaching \c query to the evaluation errors it throws
   template <typename TFunc>
   decltype(auto) CompiledQuery::WithQueryText(PathArg query, TFunc && func)
   {
      try
      {
         return func();
      }
      catch (QueryException & x)
      {
         if (x.FullQuery().empty())
            x.SetPosition(query, 0, 0, 0);
         throw;
      }
   }

   /** evaluates the query for \c cur. \c $ and \c @ at the top level of the query both refer to \c cur. */
   Selection CompiledQuery::Evaluate(Selection const & cur) const
   {
      return WithQueryText(m_impl->text, [&] { return Evaluator(*m_impl->functions).EvalQuery(m_impl->expr, cur); });
   }

   std::string const & CompiledQuery::Text() const
   {
      return m_impl->text;
   }

   std::string CompiledQuery::Dump() const
   {
      return YamlSelectDetail::Dump(m_impl->expr.path);
   }


   // ----- PathQuery

   PathQuery::PathQuery(FunctionRegistry functions) : m_functions(std::make_shared<FunctionRegistry const>(std::move(functions)))
   {
   }

   /** parses \c query. Throws a \ref QueryException for a malformed query. */
   CompiledQuery PathQuery::Compile(PathArg query) const
   {
      auto impl = std::make_shared<CompiledQuery::Impl>();
      impl->text = std::string(query);
      impl->expr = Parser(impl->text).ParseQuery();
      impl->functions = m_functions;

      if (spdlog::default_logger_raw()->should_log(spdlog::level::trace))
         spdlog::trace("yaml-select: compiled '{}' to {}", impl->text, YamlSelectDetail::Dump(impl->expr.path));

      return CompiledQuery(std::move(impl));
   }

   /** runs \c query for \c cur and returns the result

      \code
         PathQuery query;
         Selection root(YAML::Load(R"({"books":[{"author":"A"},{"author":"B"}]})"));
         Selection authors = query.Select(R"($.."author")", root);       // "A", "B"
      \endcode
   */
   Selection PathQuery::Select(PathArg query, Selection const & cur) const
   {
      return Compile(query).Evaluate(cur);
   }

   /** evaluates the filter expression \c filter with \c @ referring to \c cur and \c $ to \c root */
   bool PathQuery::Test(PathArg filter, Selection const & cur, Selection const & root) const
   {
      auto expr = Parser(filter).ParseFilter();
      return CompiledQuery::WithQueryText(filter, [&] { return Evaluator(*m_functions).EvalPredicate(*expr, cur, root); });
   }

   /** evaluates a single function call like <code>startswith(@, "E")</code> and returns its result */
   Node PathQuery::Call(PathArg call, Selection const & cur, Selection const & root) const
   {
      auto expr = Parser(call).ParseCall();
      return CompiledQuery::WithQueryText(call, [&] { return Evaluator(*m_functions).EvalCall(*expr, cur, root); });
   }

   Selection Select(Selection const & cur, PathArg query)
   {
      return PathQuery().Select(query, cur);
   }

   Selection Select(Node root, PathArg query)
   {
      return PathQuery().Select(query, Selection(root));
   }

   /** checks if \c query is well-formed, without evaluating it.

      \param valid [out, optional]: receives the part of the query that was parsed without error
      \param errorOffs [out, optional]: receives the offset of the error
      \returns \c EQueryError::OK, or the parse error
   */
   EQueryError QueryValidate(PathArg query, std::string * valid, std::size_t * errorOffs)
   {
      try
      {
         Parser(query).ParseQuery();
         if (valid)
            *valid = std::string(query);
         if (errorOffs)
            *errorOffs = query.size();
         return EQueryError::OK;
      }
      catch (QueryException const & x)
      {
         if (valid)
            *valid = x.ValidQuery();
         if (errorOffs)
            *errorOffs = x.ErrorOffset();
         return x.Error();
      }
   }
}
