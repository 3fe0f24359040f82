// ╻ ╻┏━┓┏┳┓╻┏ ┏━╸┏━╸┏━┓
// ┗┳┛┣━┫┃┃┃┣┻┓┣╸ ┣╸ ┣━┛
//  ╹ ╹ ╹╹ ╹╹ ╹┗━╸┗━╸╹
//  YAML documents that keep their comments and spacing
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by the yamkeep contributors
#pragma once

// Standard library includes
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// spdlog (fmt is reached through spdlog so both always agree on a version)
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace yamkeep {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  // Constants describing the emitted text. This block provides a single
  // location for easy editing to allow for future changes.
  inline constexpr char COMMENT_MARKER = '#';
  inline constexpr char KEY_DELIMITER = ':';
  inline constexpr char QUOTE = '"';

  inline const std::string INDENT = "  ";
  inline const std::string LIST_MARKER = "- ";
  inline const std::string EMPTY_MAPPING = "{}";
  inline const std::string EMPTY_SEQUENCE = "[]";

  // Sibling files used by Document::save()
  inline const std::string DEFAULT_TEMP_SUFFIX = ".tmp";
  inline const std::string DEFAULT_BACKUP_SUFFIX = ".bak";

} // namespace yamkeep::internal

  //------------------------------------------------------------------------
  // Errors
  //------------------------------------------------------------------------

  class Error : public std::runtime_error {
  public:
    explicit Error( const std::string& msg ) : std::runtime_error( msg ) {}
  };

  // Text that is not valid YAML, or valid YAML this library cannot hold
  class ParseError : public Error {
  public:
    explicit ParseError( const std::string& detail )
      : Error( "parse error: " + detail ) {}
  };

  class IOError : public Error {
  public:
    IOError( const std::string& path, const std::string& detail )
      : Error( "I/O error (file: " + path + "): " + detail ), path_( path ) {}

    const std::string& path() const { return path_; }

  private:
    std::string path_;
  };

  // Invalid arguments when building annotations, nodes or documents
  class ConfigurationError : public Error {
  public:
    explicit ConfigurationError( const std::string& detail )
      : Error( "configuration error: " + detail ) {}
  };

  class TypeError : public Error {
  public:
    explicit TypeError( const std::string& detail )
      : Error( "type error: " + detail ) {}
  };

  //------------------------------------------------------------------------
  // Annotations
  //------------------------------------------------------------------------

  // A run of one or more consecutive comment lines. The anchor fields are
  // filled in by extract_annotations() and locate the comment relative to
  // the first content line that follows it in the source text. Comments
  // created by callers leave them empty.
  struct Comment {
    std::string text;
    int indent_level = 0;
    std::optional< std::string > anchor_key;
    int anchor_occurrence = 0;
    std::optional< std::string > trailing_line;
    // Zero-based source line number of trailing_line
    std::optional< std::size_t > trailing_line_index;

    Comment() = default;
    inline explicit Comment( std::string comment_text, int indent = 0 );

    // Value portion of the trailing line: the text after the key's colon,
    // or the whole line minus a list marker when the line has no key
    inline std::optional< std::string > anchor_value() const;

    // Nothing but blank lines and comments follow this one in the source
    inline bool at_document_end() const;

    inline std::vector< std::string > lines() const;

    inline bool operator==( const Comment& other ) const;
    inline bool operator!=( const Comment& other ) const;
  };

  // A run of blank lines. Blank lines visually close the content above
  // them, so the anchor looks backward at the preceding non-blank line.
  struct BreakLine {
    int count = 1;
    std::optional< std::string > anchor_key;
    int anchor_occurrence = 0;
    std::optional< std::string > preceding_line;

    inline explicit BreakLine( int line_count = 1 );

    inline std::optional< std::string > anchor_value() const;

    // The preceding line is a comment, so the run belongs after that comment
    inline bool follows_comment() const;

    // Nothing precedes the run in the source
    inline bool at_document_start() const;

    inline bool operator==( const BreakLine& other ) const;
    inline bool operator!=( const BreakLine& other ) const;
  };

  //------------------------------------------------------------------------
  // Node model
  //------------------------------------------------------------------------

  struct Entry;

  // Tagged value tree. A Mapping or Sequence holds an ordered entry list in
  // which Comment and BreakLine nodes sit between ordinary entries; those
  // annotation entries carry an empty key and never take part in lookup.
  class Node {
  public:
    enum class Type {
      Null,
      Boolean,
      Integer,
      Float,
      String,
      Mapping,
      Sequence,
      Comment,
      BreakLine
    };

    Node() = default;
    Node( std::nullptr_t ) {}
    Node( bool b ) : type_( Type::Boolean ),
      value_( std::in_place_type< bool >, b ) {}

    template < typename T, typename std::enable_if< std::is_integral< T >::value
      && !std::is_same< T, bool >::value, int >::type = 0 >
    Node( T i ) : type_( Type::Integer ),
      value_( std::in_place_type< std::int64_t >,
        static_cast< std::int64_t >( i ) ) {}

    Node( double d ) : type_( Type::Float ),
      value_( std::in_place_type< double >, d ) {}
    Node( const char* s ) : type_( Type::String ),
      value_( std::in_place_type< std::string >, s ) {}
    Node( std::string s ) : type_( Type::String ),
      value_( std::in_place_type< std::string >, std::move(s) ) {}
    Node( yamkeep::Comment c ) : type_( Type::Comment ),
      value_( std::in_place_type< yamkeep::Comment >, std::move(c) ) {}
    Node( yamkeep::BreakLine b ) : type_( Type::BreakLine ),
      value_( std::in_place_type< yamkeep::BreakLine >, std::move(b) ) {}

    static inline Node mapping();
    static inline Node sequence();

    Type type() const { return type_; }

    bool is_null() const { return type_ == Type::Null; }
    bool is_boolean() const { return type_ == Type::Boolean; }
    bool is_integer() const { return type_ == Type::Integer; }
    bool is_float_number() const { return type_ == Type::Float; }
    bool is_string() const { return type_ == Type::String; }
    bool is_mapping() const { return type_ == Type::Mapping; }
    bool is_sequence() const { return type_ == Type::Sequence; }
    bool is_comment() const { return type_ == Type::Comment; }
    bool is_break_line() const { return type_ == Type::BreakLine; }
    bool is_scalar() const { return type_ <= Type::String; }
    bool is_annotation() const { return is_comment() || is_break_line(); }

    // Typed access, throwing TypeError on a mismatch
    inline bool get_boolean() const;
    inline std::int64_t get_integer() const;
    inline double get_float() const;
    inline const std::string& get_string() const;
    inline const yamkeep::Comment& get_comment() const;
    inline yamkeep::Comment& get_comment();
    inline const yamkeep::BreakLine& get_break_line() const;
    inline yamkeep::BreakLine& get_break_line();

    // Full ordered entry list of a Mapping or Sequence, annotations included
    inline const std::vector< Entry >& entries() const;
    inline std::vector< Entry >& entries();

    // Number of ordinary entries (Mapping) or data items (Sequence)
    inline std::size_t size() const;
    inline bool empty() const;

    // Mapping access
    inline bool contains( const std::string& key ) const;
    inline const Node* find( const std::string& key ) const;
    inline Node* find( const std::string& key );
    inline const Node& at( const std::string& key ) const;
    inline Node& at( const std::string& key );
    inline Node& operator[]( const std::string& key );
    inline void set( const std::string& key, Node value );
    inline bool erase( const std::string& key );
    inline std::vector< std::string > keys() const;

    // Annotation placement inside a Mapping
    inline bool insert_before( const std::string& key, Node annotation );
    inline bool insert_after( const std::string& key, Node annotation );
    inline void append( Node annotation );

    // Sequence access; indices count data items only
    inline void push_back( Node item );
    inline const Node& at( std::size_t index ) const;
    inline Node& at( std::size_t index );

    // Copy of this tree with every Comment and BreakLine removed
    inline Node without_annotations() const;

    inline bool operator==( const Node& other ) const;
    inline bool operator!=( const Node& other ) const;

  private:
    Type type_ = Type::Null;
    std::variant< std::monostate, bool, std::int64_t, double, std::string,
      yamkeep::Comment, yamkeep::BreakLine > value_;
    std::vector< Entry > entries_;

    inline void require( Type expected ) const;
    inline void require_container() const;
    inline std::vector< Entry >::iterator find_entry( const std::string& key );
    inline std::vector< Entry >::const_iterator
      find_entry( const std::string& key ) const;
  };

  struct Entry {
    std::string key;
    Node value;

    bool operator==( const Entry& other ) const {
      return key == other.key && value == other.value;
    }
    bool operator!=( const Entry& other ) const { return !( *this == other ); }
  };

  // Output of the annotation extractor, in source order
  struct Annotations {
    std::vector< Comment > comments;
    std::vector< BreakLine > break_lines;
  };

  //------------------------------------------------------------------------
  // Core engine
  //------------------------------------------------------------------------

  // Parse YAML text into an annotation-free tree. An empty (or comment-only)
  // text yields an empty Mapping; any other non-mapping root is rejected.
  inline Node parse( const std::string& text );

  // Number of entries keyed `key` in `tree` at depth <= max_depth, where
  // the root Mapping's own entries sit at depth 0
  inline int count_occurrences( const Node& tree, const std::string& key,
    int max_depth );

  // Scan raw text for comment runs and blank-line runs and anchor each one
  // against the parsed tree
  inline Annotations extract_annotations( const std::string& raw_text,
    const Node& original_tree );

  // Splice annotations into a copy of the tree. Annotations that find no
  // anchor are dropped.
  inline Node merge_annotations( const Node& tree,
    const Annotations& annotations );

  // Emit a Mapping as block-style YAML text
  inline std::string render( const Node& tree );

  //------------------------------------------------------------------------
  // Document
  //------------------------------------------------------------------------

  struct DocumentOptions {
    // Comment line written at the top of the emitted text (none if empty)
    std::string banner;
    std::string temp_suffix = internal::DEFAULT_TEMP_SUFFIX;
    std::string backup_suffix = internal::DEFAULT_BACKUP_SUFFIX;
  };

  struct CommentOptions {
    int indent_level = 0;
    // Place the comment before this top-level key instead of at the end
    std::optional< std::string > before_key;
  };

  class Document {
  public:
    // Empty document bound to `path` (which may be empty for in-memory use)
    inline explicit Document( std::string path = std::string(),
      DocumentOptions options = DocumentOptions() );

    static inline Document load( const std::string& path,
      DocumentOptions options = DocumentOptions() );
    static inline Document from_text( const std::string& text,
      const std::string& path = std::string(),
      DocumentOptions options = DocumentOptions() );
    static inline Document from_stream( std::istream& in,
      const std::string& path = std::string(),
      DocumentOptions options = DocumentOptions() );

    const std::string& path() const { return path_; }
    const DocumentOptions& options() const { return options_; }

    // Live, editable tree
    Node& root() { return root_; }
    const Node& root() const { return root_; }

    // Tree as parsed at load time, without annotations
    const Node& original_tree() const { return original_; }

    // Value for a top-level key, or a null Node when the key is absent
    inline Node get( const std::string& key ) const;
    inline const Node* find( const std::string& key ) const;
    inline Node* find( const std::string& key );
    inline Node& operator[]( const std::string& key );

    inline void set( const std::string& key, Node value );
    inline bool erase( const std::string& key );

    inline void add_comment( const std::string& text,
      const CommentOptions& opts = CommentOptions() );
    inline void add_break_line( int count = 1,
      const std::optional< std::string >& after_key = std::nullopt );

    // Write the rendered text to path() and return it
    inline std::string save();
    inline std::string to_text() const;

    bool operator==( const Document& other ) const {
      return to_text() == other.to_text();
    }
    bool operator!=( const Document& other ) const {
      return !( *this == other );
    }

  private:
    std::string path_;
    DocumentOptions options_;
    Node root_;
    Node original_;
  };

namespace internal {

  //------------------------------------------------------------------------
  // String helpers
  //------------------------------------------------------------------------

  inline bool is_blank_char( char c ) {
    return std::isspace( static_cast< unsigned char >(c) ) != 0;
  }

  inline std::string ltrim( const std::string& s ) {
    std::size_t b = 0;
    while ( b < s.size() && is_blank_char(s[b]) ) ++b;
    return s.substr( b );
  }

  inline std::string rtrim( const std::string& s ) {
    std::size_t e = s.size();
    while ( e > 0 && is_blank_char(s[e - 1]) ) --e;
    return s.substr( 0, e );
  }

  inline std::string trim( const std::string& s ) {
    return ltrim( rtrim(s) );
  }

  inline int leading_spaces( const std::string& line ) {
    int n = 0;
    while ( static_cast< std::size_t >(n) < line.size() && line[n] == ' ' ) {
      ++n;
    }
    return n;
  }

  inline std::string indent_of( int level ) {
    if ( level <= 0 ) return std::string();
    return std::string( static_cast< std::size_t >(level) * INDENT.size(),
      ' ' );
  }

  // Split on a single character, keeping empty segments
  inline std::vector< std::string > split( const std::string& s, char delim ) {
    std::vector< std::string > out;
    std::size_t start = 0;
    while ( true ) {
      std::size_t pos = s.find( delim, start );
      if ( pos == std::string::npos ) {
        out.push_back( s.substr(start) );
        break;
      }
      out.push_back( s.substr(start, pos - start) );
      start = pos + 1;
    }
    return out;
  }

  // Split raw text into lines. "\n", "\r\n" and "\r" all end a line, and a
  // final line terminator does not produce an extra empty line.
  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    std::string current;
    for ( std::size_t i = 0; i < text.size(); ++i ) {
      const char c = text[ i ];
      if ( c == '\r' || c == '\n' ) {
        if ( c == '\r' && i + 1 < text.size() && text[i + 1] == '\n' ) ++i;
        lines.push_back( current );
        current.clear();
        continue;
      }
      current += c;
    }
    if ( !current.empty() ) lines.push_back( current );
    return lines;
  }

  inline std::string join( const std::vector< std::string >& parts,
    const std::string& sep )
  {
    std::string s;
    for ( std::size_t i = 0; i < parts.size(); ++i ) {
      if ( i ) s += sep;
      s += parts[ i ];
    }
    return s;
  }

  //------------------------------------------------------------------------
  // Raw line analysis
  //------------------------------------------------------------------------

  inline bool is_comment_line( const std::string& line ) {
    const std::string t = ltrim( line );
    return !t.empty() && t[0] == COMMENT_MARKER;
  }

  // Comment text of a marker line: the marker and one following space
  // removed, trailing whitespace dropped
  inline std::string comment_line_text( const std::string& line ) {
    std::string t = ltrim( line );
    if ( !t.empty() && t[0] == COMMENT_MARKER ) t.erase( 0, 1 );
    if ( !t.empty() && t[0] == ' ' ) t.erase( 0, 1 );
    return rtrim( t );
  }

  // Remove an inline trailing comment: a marker preceded by whitespace and
  // followed by a run of non-quote characters up to the end of the line
  inline std::string strip_inline_comment( const std::string& line ) {
    for ( std::size_t i = 1; i < line.size(); ++i ) {
      if ( line[i] != COMMENT_MARKER || !is_blank_char(line[i - 1]) ) continue;
      if ( line.find_first_of( "\"'", i ) != std::string::npos ) continue;
      return rtrim( line.substr(0, i) );
    }
    return line;
  }

  inline bool is_list_marker_at( const std::string& s, std::size_t pos ) {
    return pos < s.size() && s[pos] == '-'
      && ( pos + 1 == s.size() || s[pos + 1] == ' ' );
  }

  // Drop leading "- " sequence-entry markers from trimmed text
  inline std::string strip_list_markers( const std::string& trimmed ) {
    std::size_t pos = 0;
    while ( is_list_marker_at(trimmed, pos) ) {
      ++pos;
      while ( pos < trimmed.size() && trimmed[pos] == ' ' ) ++pos;
    }
    return trimmed.substr( pos );
  }

  // Column where the node text of a line starts, after indentation and any
  // sequence-entry markers
  inline int node_column( const std::string& line ) {
    std::size_t pos = static_cast< std::size_t >( leading_spaces(line) );
    while ( is_list_marker_at(line, pos) ) {
      ++pos;
      while ( pos < line.size() && line[pos] == ' ' ) ++pos;
    }
    return static_cast< int >( pos );
  }

  // Column of the last sequence-entry marker of a line, or the indentation
  // when the line has none
  inline int marker_column( const std::string& line ) {
    std::size_t pos = static_cast< std::size_t >( leading_spaces(line) );
    std::size_t last = pos;
    while ( is_list_marker_at(line, pos) ) {
      last = pos;
      ++pos;
      while ( pos < line.size() && line[pos] == ' ' ) ++pos;
    }
    return static_cast< int >( last );
  }

  // Position of the ':' that ends a key in marker-free text, skipping a
  // quoted key. A key ends at ": " or at a ':' closing the line.
  inline std::size_t key_delimiter( const std::string& text ) {
    std::size_t from = 0;
    if ( !text.empty() && (text[0] == '"' || text[0] == '\'') ) {
      const std::size_t close = text.find( text[0], 1 );
      if ( close == std::string::npos ) return std::string::npos;
      from = close + 1;
    }
    for ( std::size_t i = from; i < text.size(); ++i ) {
      if ( text[i] != KEY_DELIMITER ) continue;
      if ( i + 1 == text.size() || is_blank_char(text[i + 1]) ) return i;
    }
    return std::string::npos;
  }

  inline std::string unquote( const std::string& s ) {
    if ( s.size() >= 2 && (s.front() == '"' || s.front() == '\'')
      && s.back() == s.front() )
    {
      return s.substr( 1, s.size() - 2 );
    }
    return s;
  }

  // Key named by a raw content line, if any
  inline std::optional< std::string > line_key( const std::string& line ) {
    const std::string t = strip_list_markers( trim(line) );
    const std::size_t pos = key_delimiter( t );
    if ( pos == std::string::npos ) return std::nullopt;
    return unquote( trim(t.substr(0, pos)) );
  }

  // Value text of a raw content line: after the key's colon, or the whole
  // marker-free line for a bare sequence entry
  inline std::string line_value( const std::string& line ) {
    const std::string t = strip_list_markers( trim(line) );
    const std::size_t pos = key_delimiter( t );
    if ( pos == std::string::npos ) return t;
    return trim( t.substr(pos + 1) );
  }

  // Literal/folded block scalar header such as "|", ">-", "|2+"
  inline bool is_block_indicator( const std::string& value ) {
    static const std::regex header( R"(^[|>]([1-9][-+]?|[-+][1-9]?)?$)" );
    return std::regex_match( value, header );
  }

  enum class LineKind { Blank, Comment, Content, BlockBody };

  struct SourceLine {
    std::string text;
    LineKind kind = LineKind::Content;
    // Tree depth of the key on a content line
    int depth = 0;
    // For BlockBody lines, index of the line holding the block header
    std::size_t owner = 0;
  };

  // Classify every raw line and compute the tree depth of keyed content
  // lines from a stack of enclosing key columns. For two-space block
  // mappings this equals the indentation halved, and it also gives the
  // right depth for keys of mappings nested in sequence entries.
  inline std::vector< SourceLine > classify_lines( const std::string& text ) {
    const std::vector< std::string > raw = split_lines( text );
    std::vector< SourceLine > lines( raw.size() );
    std::vector< int > key_columns;

    std::size_t i = 0;
    while ( i < raw.size() ) {
      SourceLine& sl = lines[ i ];
      sl.text = raw[ i ];

      const std::string t = trim( raw[i] );
      if ( t.empty() ) { sl.kind = LineKind::Blank; ++i; continue; }
      if ( t[0] == COMMENT_MARKER ) { sl.kind = LineKind::Comment; ++i; continue; }

      sl.kind = LineKind::Content;
      const std::string content = strip_inline_comment( raw[i] );
      const std::optional< std::string > key = line_key( content );
      const int column = node_column( raw[i] );
      if ( key ) {
        while ( !key_columns.empty() && key_columns.back() >= column ) {
          key_columns.pop_back();
        }
        sl.depth = static_cast< int >( key_columns.size() );
        key_columns.push_back( column );
      }
      else {
        sl.depth = static_cast< int >( key_columns.size() );
      }

      const std::string value = line_value( content );
      if ( !is_block_indicator(value) ) { ++i; continue; }

      // Body lines of a block scalar are indented past its parent node.
      // Blank lines between body lines belong to the body; trailing blank
      // lines only do when the header asks to keep them.
      const int threshold = key ? column : marker_column( raw[i] );
      const bool keep_trailing = value.find( '+' ) != std::string::npos;
      std::size_t last_body = i;
      for ( std::size_t j = i + 1; j < raw.size(); ++j ) {
        if ( trim(raw[j]).empty() ) {
          if ( keep_trailing ) last_body = j;
          continue;
        }
        if ( leading_spaces(raw[j]) <= threshold ) break;
        last_body = j;
      }
      for ( std::size_t j = i + 1; j <= last_body; ++j ) {
        lines[ j ].text = raw[ j ];
        lines[ j ].kind = LineKind::BlockBody;
        lines[ j ].owner = i;
      }
      i = last_body + 1;
    }
    return lines;
  }

  //------------------------------------------------------------------------
  // Scalar text
  //------------------------------------------------------------------------

  inline std::string format_float( double d ) {
    if ( std::isnan(d) ) return ".nan";
    if ( std::isinf(d) ) return d > 0 ? ".inf" : "-.inf";
    std::string s = fmt::format( "{}", d );
    // Keep integral values recognizable as floats when read back
    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

  // Canonical text of a scalar, unquoted
  inline std::string scalar_text( const Node& n ) {
    switch ( n.type() ) {
      case Node::Type::Null: return std::string();
      case Node::Type::Boolean: return n.get_boolean() ? "true" : "false";
      case Node::Type::Integer: return std::to_string( n.get_integer() );
      case Node::Type::Float: return format_float( n.get_float() );
      case Node::Type::String: return n.get_string();
      default: break;
    }
    throw TypeError( "expected a scalar node" );
  }

  // Would this plain text be read back as null, a boolean or a number?
  inline bool resolves_to_non_string( const std::string& s ) {
    static const std::regex special( R"(^(~|null|Null|NULL|true|True|TRUE|)"
      R"(false|False|FALSE|yes|Yes|YES|no|No|NO|on|On|ON|off|Off|OFF)$)" );
    static const std::regex integer( R"(^([-+]?[0-9]+|0o[0-7]+|0x[0-9a-fA-F]+)$)" );
    static const std::regex real(
      R"(^[-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)" );
    static const std::regex named( R"(^([-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))$)" );
    return std::regex_match( s, special ) || std::regex_match( s, integer )
      || std::regex_match( s, real ) || std::regex_match( s, named );
  }

  inline bool has_control_chars( const std::string& s ) {
    for ( char c : s ) {
      const unsigned char u = static_cast< unsigned char >( c );
      if ( u < 0x20 || u == 0x7f ) return true;
    }
    return false;
  }

  // Plain text that would be misread, or not read at all, without quotes
  inline bool is_ambiguous_plain( const std::string& s ) {
    static const std::string indicators = "-?:,[]{}#&*!|>'\"%@`";
    if ( s.empty() ) return true;
    if ( is_blank_char(s.front()) || is_blank_char(s.back()) ) return true;
    if ( indicators.find(s.front()) != std::string::npos ) return true;
    if ( s.find(": ") != std::string::npos ) return true;
    if ( s.find(" #") != std::string::npos ) return true;
    if ( s.back() == KEY_DELIMITER ) return true;
    return has_control_chars( s );
  }

  // Double-quoted form; backslash and the quote character are escaped
  // along with control characters
  inline std::string quote( const std::string& s ) {
    std::string out( 1, QUOTE );
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\r': out += "\\r"; break;
        default:
          if ( static_cast< unsigned char >(c) < 0x20 ) {
            out += fmt::format( "\\x{:02x}",
              static_cast< unsigned int >( static_cast< unsigned char >(c) ) );
          }
          else {
            out += c;
          }
      }
    }
    out += QUOTE;
    return out;
  }

  inline std::string format_string( const std::string& s ) {
    const std::string t = ltrim( s );
    if ( !t.empty() && (t[0] == '|' || t[0] == '>') ) return quote( s );
    if ( is_ambiguous_plain(s) || resolves_to_non_string(s) ) return quote( s );
    return s;
  }

  // Keys resolve to strings on load, so plain keys only need quotes when
  // their text would not survive the trip (floats, nulls, padded integers)
  inline std::string format_key( const std::string& key ) {
    static const std::regex canonical( R"(^(-?(0|[1-9][0-9]*)|true|false)$)" );
    if ( is_ambiguous_plain(key) ) return quote( key );
    if ( resolves_to_non_string(key) && !std::regex_match(key, canonical) ) {
      return quote( key );
    }
    return key;
  }

  // Inline form of a scalar (never a block scalar)
  inline std::string format_scalar( const Node& n ) {
    if ( n.is_string() ) return format_string( n.get_string() );
    return scalar_text( n );
  }

  // Can a multi-line string be written as a literal block scalar without an
  // explicit indentation indicator?
  inline bool fits_literal_block( const std::string& s ) {
    if ( s.find('\r') != std::string::npos ) return false;
    for ( char c : s ) {
      const unsigned char u = static_cast< unsigned char >( c );
      if ( (u < 0x20 && c != '\n' && c != '\t') || u == 0x7f ) return false;
    }
    std::string body = s;
    while ( !body.empty() && body.back() == '\n' ) body.pop_back();
    bool seen_text = false;
    for ( const auto& line : split(body, '\n') ) {
      if ( line.empty() ) continue;
      if ( trim(line).empty() ) return false;
      if ( !seen_text && is_blank_char(line[0]) ) return false;
      seen_text = true;
    }
    return seen_text;
  }

  // Append " <scalar>\n" after a key or sequence marker. Multi-line strings
  // become literal block scalars whose content sits at `content_level`.
  inline void append_scalar( std::string& out, const Node& n,
    int content_level )
  {
    if ( n.is_null() ) { out += '\n'; return; }
    if ( n.is_string() && n.get_string().find('\n') != std::string::npos
      && fits_literal_block(n.get_string()) )
    {
      const std::string& s = n.get_string();
      std::size_t trailing = 0;
      while ( trailing < s.size() && s[s.size() - 1 - trailing] == '\n' ) {
        ++trailing;
      }
      out += trailing == 0 ? " |-\n" : ( trailing == 1 ? " |\n" : " |+\n" );
      const std::string indent = indent_of( content_level );
      for ( const auto& line : split(s.substr(0, s.size() - trailing), '\n') ) {
        if ( !line.empty() ) out += indent + rtrim( line );
        out += '\n';
      }
      if ( trailing > 1 ) out.append( trailing - 1, '\n' );
      return;
    }
    out += ' ';
    out += format_scalar( n );
    out += '\n';
  }

  // Flow-style text, used for sequences nested directly in sequences
  inline std::string format_flow( const Node& n ) {
    if ( n.is_sequence() ) {
      std::vector< std::string > parts;
      for ( const auto& e : n.entries() ) {
        if ( e.value.is_annotation() ) continue;
        parts.push_back( format_flow(e.value) );
      }
      return "[" + join( parts, ", " ) + "]";
    }
    if ( n.is_mapping() ) {
      std::vector< std::string > parts;
      for ( const auto& e : n.entries() ) {
        if ( e.value.is_annotation() ) continue;
        parts.push_back( quote(e.key) + ": " + format_flow(e.value) );
      }
      return "{" + join( parts, ", " ) + "}";
    }
    if ( n.is_null() ) return "null";
    if ( n.is_string() ) return quote( n.get_string() );
    return scalar_text( n );
  }

  //------------------------------------------------------------------------
  // fkYAML conversion
  //------------------------------------------------------------------------

  // Text of a mapping key; non-string scalar keys are stringified
  inline std::string key_text( const ordered_node& k ) {
    if ( k.is_string() ) return k.get_value< std::string >();
    if ( k.is_integer() ) return std::to_string( k.get_value< std::int64_t >() );
    if ( k.is_boolean() ) return k.get_value< bool >() ? "true" : "false";
    if ( k.is_float_number() ) return format_float( k.get_value< double >() );
    if ( k.is_null() ) return "null";
    return ordered_node::serialize( k );
  }

  // Aliases arrive expanded from fkYAML and are written back expanded
  inline Node from_yaml( const ordered_node& n ) {
    if ( n.is_alias() ) {
      spdlog::debug( "yamkeep: alias expanded, anchors are not preserved" );
    }
    if ( n.is_mapping() ) {
      Node m = Node::mapping();
      for ( const auto& [mk, mv] : n.map_items() ) {
        m.set( key_text(mk), from_yaml(mv) );
      }
      return m;
    }
    if ( n.is_sequence() ) {
      Node s = Node::sequence();
      for ( std::size_t i = 0; i < n.size(); ++i ) {
        s.push_back( from_yaml(n.at(i)) );
      }
      return s;
    }
    if ( n.is_boolean() ) return Node( n.get_value< bool >() );
    if ( n.is_integer() ) return Node( n.get_value< std::int64_t >() );
    if ( n.is_float_number() ) return Node( n.get_value< double >() );
    if ( n.is_string() ) return Node( n.get_value< std::string >() );
    return Node();
  }

  //------------------------------------------------------------------------
  // Annotation matching
  //------------------------------------------------------------------------

  // Text with quote characters and escapes removed, for loose comparison
  inline std::string strip_quotes( const std::string& s ) {
    std::string out;
    out.reserve( s.size() );
    for ( char c : s ) {
      if ( c == '"' || c == '\'' || c == '\\' ) continue;
      out += c;
    }
    return out;
  }

  inline std::string to_lower( std::string s ) {
    for ( auto& c : s ) {
      c = static_cast< char >( std::tolower(static_cast< unsigned char >(c)) );
    }
    return s;
  }

  inline bool numerically_equal( const std::string& text, double value ) {
    if ( text.empty() ) return false;
    char* end = nullptr;
    const double parsed = std::strtod( text.c_str(), &end );
    if ( end == text.c_str() || *end != '\0' ) return false;
    return parsed == value;
  }

  // Does the value text recorded from a raw line describe this node?
  // Structural and null values match on key and occurrence alone.
  inline bool value_matches( const std::optional< std::string >& text,
    const Node& value )
  {
    if ( value.is_mapping() || value.is_sequence() || value.is_null() ) {
      return true;
    }
    if ( !text || value.is_annotation() ) return false;

    const std::string t = trim( *text );
    if ( value.is_string() && is_block_indicator(t) ) return true;

    const std::string expected = scalar_text( value );
    if ( strip_quotes(t) == strip_quotes(expected) ) return true;
    if ( value.is_boolean() ) return to_lower( t ) == expected;
    if ( value.is_integer() ) {
      return numerically_equal( strip_quotes(t),
        static_cast< double >( value.get_integer() ) );
    }
    if ( value.is_float_number() ) {
      return numerically_equal( strip_quotes(t), value.get_float() );
    }
    return false;
  }

  //------------------------------------------------------------------------
  // Merge session
  //------------------------------------------------------------------------

  // Places annotations into a copy of a parsed tree. Each annotation is used
  // at most once; the consumed flags live only as long as the session.
  class AnnotationMerger {
  public:
    AnnotationMerger( const Node& tree, const Annotations& annotations )
      : tree_( tree ), comments_( annotations.comments ),
        break_lines_( annotations.break_lines ),
        comment_used_( annotations.comments.size(), false ),
        break_used_( annotations.break_lines.size(), false ) {}

    inline Node merge();

  private:
    const Node& tree_;
    const std::vector< Comment >& comments_;
    const std::vector< BreakLine >& break_lines_;
    std::vector< bool > comment_used_;
    std::vector< bool > break_used_;

    // Sweep 1: comments go before the entry they anchor to
    inline Node merge_comments( const Node& map, int depth );
    inline Node merge_comments_in_sequence( const Node& seq, int depth );
    inline void take_comment_runs( std::size_t first,
      std::vector< Entry >& out );

    // Sweep 2: blank-line runs go after the entry or comment they follow
    inline Node place_break_lines( const Node& map, int depth );
    inline Node place_break_lines_in_sequence( const Node& seq, int depth );
    inline void take_break_lines_after( const Comment& comment,
      std::vector< Entry >& out );

    inline void report_unused() const;
  };

  //------------------------------------------------------------------------
  // Rendering
  //------------------------------------------------------------------------

  inline void render_comment( const Comment& comment, int level,
    std::string& out )
  {
    const std::string indent = indent_of( level );
    for ( const auto& line : comment.lines() ) {
      std::string text = indent + COMMENT_MARKER;
      if ( !line.empty() ) text += ' ' + line;
      out += rtrim( text );
      out += '\n';
    }
  }

  inline int comment_level( const Comment& comment, int level ) {
    return comment.indent_level > 0 ? comment.indent_level : level;
  }

  inline void render_mapping( const Node& map, int level, int array_item_index,
    std::string& out );

  inline void render_sequence( const Node& seq, int level, std::string& out ) {
    const std::string indent = indent_of( level );
    int index = 0;
    for ( const auto& e : seq.entries() ) {
      const Node& item = e.value;
      switch ( item.type() ) {
        case Node::Type::Comment:
          render_comment( item.get_comment(),
            comment_level(item.get_comment(), level), out );
          continue;
        case Node::Type::BreakLine:
          out.append( static_cast< std::size_t >(item.get_break_line().count),
            '\n' );
          continue;
        case Node::Type::Mapping:
          if ( item.empty() ) out += indent + LIST_MARKER + EMPTY_MAPPING + '\n';
          else render_mapping( item, level, index, out );
          break;
        case Node::Type::Sequence:
          out += indent + LIST_MARKER + format_flow( item ) + '\n';
          break;
        default:
          out += indent + '-';
          append_scalar( out, item, level + 1 );
          break;
      }
      ++index;
    }
  }

  // Entries of `map` at `level`. When the mapping is itself the
  // array_item_index-th entry of a sequence (-1 when it is not), its first
  // key carries the "- " marker and the rest align under it.
  inline void render_mapping( const Node& map, int level, int array_item_index,
    std::string& out )
  {
    const bool in_item = array_item_index > -1;
    const std::string indent = indent_of( level );
    bool first_key = true;

    for ( const auto& e : map.entries() ) {
      const Node& value = e.value;
      // Inside a sequence item, a comment above the first key lines up with
      // the hyphen and later ones with the keys
      if ( value.is_comment() ) {
        const int base = level + ( in_item && !first_key ? 1 : 0 );
        render_comment( value.get_comment(),
          comment_level( value.get_comment(), base ), out );
        continue;
      }
      if ( value.is_break_line() ) {
        out.append( static_cast< std::size_t >(value.get_break_line().count),
          '\n' );
        continue;
      }

      out += indent;
      if ( in_item ) out += first_key ? LIST_MARKER : INDENT;
      first_key = false;
      out += format_key( e.key );
      out += KEY_DELIMITER;

      // Nested blocks sit one level below the key, which itself is one
      // level in when the hyphen of a sequence entry precedes it
      const int child = level + 1 + ( in_item ? 1 : 0 );
      if ( value.is_mapping() ) {
        if ( value.empty() ) { out += ' ' + EMPTY_MAPPING + '\n'; continue; }
        out += '\n';
        render_mapping( value, child, -1, out );
      }
      else if ( value.is_sequence() ) {
        if ( value.empty() ) { out += ' ' + EMPTY_SEQUENCE + '\n'; continue; }
        out += '\n';
        render_sequence( value, child, out );
      }
      else {
        append_scalar( out, value, child );
      }
    }
  }

  inline Node without_annotations( const Node& n ) {
    if ( !n.is_mapping() && !n.is_sequence() ) return n;
    Node out = n.is_mapping() ? Node::mapping() : Node::sequence();
    for ( const auto& e : n.entries() ) {
      if ( e.value.is_annotation() ) continue;
      out.entries().push_back( Entry{ e.key, without_annotations(e.value) } );
    }
    return out;
  }

  inline std::string type_name( Node::Type t ) {
    switch ( t ) {
      case Node::Type::Null: return "null";
      case Node::Type::Boolean: return "boolean";
      case Node::Type::Integer: return "integer";
      case Node::Type::Float: return "float";
      case Node::Type::String: return "string";
      case Node::Type::Mapping: return "mapping";
      case Node::Type::Sequence: return "sequence";
      case Node::Type::Comment: return "comment";
      case Node::Type::BreakLine: return "break line";
    }
    return "unknown";
  }

} // namespace yamkeep::internal

} // namespace yamkeep

//--------------------------------------------------------------------------
// Annotations
//--------------------------------------------------------------------------

inline yamkeep::Comment::Comment( std::string comment_text, int indent )
  : text( std::move(comment_text) ), indent_level( indent )
{
  if ( indent_level < 0 ) {
    throw ConfigurationError( "comment indent level must not be negative" );
  }
}

inline std::optional< std::string > yamkeep::Comment::anchor_value() const {
  if ( !trailing_line ) return std::nullopt;
  return internal::line_value( *trailing_line );
}

inline bool yamkeep::Comment::at_document_end() const {
  return !anchor_key && !trailing_line;
}

inline std::vector< std::string > yamkeep::Comment::lines() const {
  return internal::split( text, '\n' );
}

inline bool yamkeep::Comment::operator==( const Comment& other ) const {
  return text == other.text && indent_level == other.indent_level
    && anchor_key == other.anchor_key
    && anchor_occurrence == other.anchor_occurrence
    && trailing_line == other.trailing_line
    && trailing_line_index == other.trailing_line_index;
}

inline bool yamkeep::Comment::operator!=( const Comment& other ) const {
  return !( *this == other );
}

inline yamkeep::BreakLine::BreakLine( int line_count ) : count( line_count ) {
  if ( count < 1 ) {
    throw ConfigurationError( "break line count must be at least 1 (got "
      + std::to_string(count) + ")" );
  }
}

inline std::optional< std::string > yamkeep::BreakLine::anchor_value() const {
  if ( !preceding_line || follows_comment() ) return std::nullopt;
  return internal::line_value( *preceding_line );
}

inline bool yamkeep::BreakLine::follows_comment() const {
  return preceding_line && internal::is_comment_line( *preceding_line );
}

inline bool yamkeep::BreakLine::at_document_start() const {
  return !preceding_line;
}

inline bool yamkeep::BreakLine::operator==( const BreakLine& other ) const {
  return count == other.count && anchor_key == other.anchor_key
    && anchor_occurrence == other.anchor_occurrence
    && preceding_line == other.preceding_line;
}

inline bool yamkeep::BreakLine::operator!=( const BreakLine& other ) const {
  return !( *this == other );
}

//--------------------------------------------------------------------------
// Node
//--------------------------------------------------------------------------

inline yamkeep::Node yamkeep::Node::mapping() {
  Node n;
  n.type_ = Type::Mapping;
  return n;
}

inline yamkeep::Node yamkeep::Node::sequence() {
  Node n;
  n.type_ = Type::Sequence;
  return n;
}

inline void yamkeep::Node::require( Type expected ) const {
  if ( type_ == expected ) return;
  throw TypeError( "expected a " + internal::type_name(expected)
    + " node, found a " + internal::type_name(type_) + " node" );
}

inline void yamkeep::Node::require_container() const {
  if ( is_mapping() || is_sequence() ) return;
  throw TypeError( "expected a mapping or sequence node, found a "
    + internal::type_name(type_) + " node" );
}

inline bool yamkeep::Node::get_boolean() const {
  require( Type::Boolean );
  return std::get< bool >( value_ );
}

inline std::int64_t yamkeep::Node::get_integer() const {
  require( Type::Integer );
  return std::get< std::int64_t >( value_ );
}

inline double yamkeep::Node::get_float() const {
  require( Type::Float );
  return std::get< double >( value_ );
}

inline const std::string& yamkeep::Node::get_string() const {
  require( Type::String );
  return std::get< std::string >( value_ );
}

inline const yamkeep::Comment& yamkeep::Node::get_comment() const {
  require( Type::Comment );
  return std::get< yamkeep::Comment >( value_ );
}

inline yamkeep::Comment& yamkeep::Node::get_comment() {
  require( Type::Comment );
  return std::get< yamkeep::Comment >( value_ );
}

inline const yamkeep::BreakLine& yamkeep::Node::get_break_line() const {
  require( Type::BreakLine );
  return std::get< yamkeep::BreakLine >( value_ );
}

inline yamkeep::BreakLine& yamkeep::Node::get_break_line() {
  require( Type::BreakLine );
  return std::get< yamkeep::BreakLine >( value_ );
}

inline const std::vector< yamkeep::Entry >& yamkeep::Node::entries() const {
  require_container();
  return entries_;
}

inline std::vector< yamkeep::Entry >& yamkeep::Node::entries() {
  require_container();
  return entries_;
}

inline std::size_t yamkeep::Node::size() const {
  if ( !is_mapping() && !is_sequence() ) return 0;
  std::size_t n = 0;
  for ( const auto& e : entries_ ) {
    if ( !e.value.is_annotation() ) ++n;
  }
  return n;
}

inline bool yamkeep::Node::empty() const {
  return size() == 0;
}

inline std::vector< yamkeep::Entry >::iterator
  yamkeep::Node::find_entry( const std::string& key )
{
  for ( auto it = entries_.begin(); it != entries_.end(); ++it ) {
    if ( !it->value.is_annotation() && it->key == key ) return it;
  }
  return entries_.end();
}

inline std::vector< yamkeep::Entry >::const_iterator
  yamkeep::Node::find_entry( const std::string& key ) const
{
  for ( auto it = entries_.begin(); it != entries_.end(); ++it ) {
    if ( !it->value.is_annotation() && it->key == key ) return it;
  }
  return entries_.end();
}

inline bool yamkeep::Node::contains( const std::string& key ) const {
  return is_mapping() && find_entry( key ) != entries_.end();
}

inline const yamkeep::Node* yamkeep::Node::find( const std::string& key ) const
{
  if ( !is_mapping() ) return nullptr;
  auto it = find_entry( key );
  return it == entries_.end() ? nullptr : &it->value;
}

inline yamkeep::Node* yamkeep::Node::find( const std::string& key ) {
  if ( !is_mapping() ) return nullptr;
  auto it = find_entry( key );
  return it == entries_.end() ? nullptr : &it->value;
}

inline const yamkeep::Node& yamkeep::Node::at( const std::string& key ) const {
  require( Type::Mapping );
  auto it = find_entry( key );
  if ( it == entries_.end() ) throw std::out_of_range( "no key '" + key + "'" );
  return it->value;
}

inline yamkeep::Node& yamkeep::Node::at( const std::string& key ) {
  require( Type::Mapping );
  auto it = find_entry( key );
  if ( it == entries_.end() ) throw std::out_of_range( "no key '" + key + "'" );
  return it->value;
}

inline yamkeep::Node& yamkeep::Node::operator[]( const std::string& key ) {
  if ( is_null() ) type_ = Type::Mapping;
  require( Type::Mapping );
  auto it = find_entry( key );
  if ( it != entries_.end() ) return it->value;
  entries_.push_back( Entry{ key, Node() } );
  return entries_.back().value;
}

inline void yamkeep::Node::set( const std::string& key, Node value ) {
  if ( value.is_annotation() ) {
    throw ConfigurationError( "key '" + key
      + "' cannot hold a comment or break line as its value" );
  }
  ( *this )[ key ] = std::move( value );
}

inline bool yamkeep::Node::erase( const std::string& key ) {
  require( Type::Mapping );
  auto it = find_entry( key );
  if ( it == entries_.end() ) return false;
  entries_.erase( it );
  return true;
}

inline std::vector< std::string > yamkeep::Node::keys() const {
  require( Type::Mapping );
  std::vector< std::string > out;
  for ( const auto& e : entries_ ) {
    if ( !e.value.is_annotation() ) out.push_back( e.key );
  }
  return out;
}

inline bool yamkeep::Node::insert_before( const std::string& key,
  Node annotation )
{
  require( Type::Mapping );
  if ( !annotation.is_annotation() ) {
    throw ConfigurationError( "only comments and break lines can be inserted" );
  }
  auto it = find_entry( key );
  if ( it == entries_.end() ) return false;
  entries_.insert( it, Entry{ std::string(), std::move(annotation) } );
  return true;
}

inline bool yamkeep::Node::insert_after( const std::string& key,
  Node annotation )
{
  require( Type::Mapping );
  if ( !annotation.is_annotation() ) {
    throw ConfigurationError( "only comments and break lines can be inserted" );
  }
  auto it = find_entry( key );
  if ( it == entries_.end() ) return false;
  entries_.insert( it + 1, Entry{ std::string(), std::move(annotation) } );
  return true;
}

inline void yamkeep::Node::append( Node annotation ) {
  if ( is_null() ) type_ = Type::Mapping;
  require( Type::Mapping );
  if ( !annotation.is_annotation() ) {
    throw ConfigurationError( "only comments and break lines can be appended;"
      " use set() for key/value pairs" );
  }
  entries_.push_back( Entry{ std::string(), std::move(annotation) } );
}

inline void yamkeep::Node::push_back( Node item ) {
  if ( is_null() ) type_ = Type::Sequence;
  require( Type::Sequence );
  entries_.push_back( Entry{ std::string(), std::move(item) } );
}

inline const yamkeep::Node& yamkeep::Node::at( std::size_t index ) const {
  require( Type::Sequence );
  std::size_t seen = 0;
  for ( const auto& e : entries_ ) {
    if ( e.value.is_annotation() ) continue;
    if ( seen++ == index ) return e.value;
  }
  throw std::out_of_range( "sequence index " + std::to_string(index)
    + " out of range" );
}

inline yamkeep::Node& yamkeep::Node::at( std::size_t index ) {
  require( Type::Sequence );
  std::size_t seen = 0;
  for ( auto& e : entries_ ) {
    if ( e.value.is_annotation() ) continue;
    if ( seen++ == index ) return e.value;
  }
  throw std::out_of_range( "sequence index " + std::to_string(index)
    + " out of range" );
}

inline yamkeep::Node yamkeep::Node::without_annotations() const {
  return internal::without_annotations( *this );
}

inline bool yamkeep::Node::operator==( const Node& other ) const {
  return type_ == other.type_ && value_ == other.value_
    && entries_ == other.entries_;
}

inline bool yamkeep::Node::operator!=( const Node& other ) const {
  return !( *this == other );
}

//--------------------------------------------------------------------------
// Core engine
//--------------------------------------------------------------------------

inline yamkeep::Node yamkeep::parse( const std::string& text ) {
  if ( internal::trim(text).empty() ) return Node::mapping();

  ordered_node dom;
  try {
    dom = ordered_node::deserialize( text );
  }
  catch ( const fkyaml::exception& ex ) {
    throw ParseError( ex.what() );
  }

  // A document holding nothing but comments parses to null
  if ( dom.is_null() ) return Node::mapping();
  if ( !dom.is_mapping() ) {
    throw ParseError( "the document root must be a mapping" );
  }
  return internal::from_yaml( dom );
}

namespace yamkeep::internal {

  inline int count_occurrences_from( const Node& node, const std::string& key,
    int depth, int max_depth )
  {
    int count = 0;
    if ( node.is_mapping() ) {
      for ( const auto& e : node.entries() ) {
        if ( e.value.is_annotation() ) continue;
        if ( e.key == key ) ++count;
        if ( (e.value.is_mapping() || e.value.is_sequence())
          && depth + 1 <= max_depth )
        {
          count += count_occurrences_from( e.value, key, depth + 1, max_depth );
        }
      }
    }
    else if ( node.is_sequence() ) {
      // Mappings held by a sequence share the depth of the sequence itself
      for ( const auto& e : node.entries() ) {
        if ( e.value.is_mapping() || e.value.is_sequence() ) {
          count += count_occurrences_from( e.value, key, depth, max_depth );
        }
      }
    }
    return count;
  }

  // Key and occurrence for an annotation anchored on a content line
  inline void anchor_on( const SourceLine& line, const Node& tree,
    std::optional< std::string >& key, int& occurrence )
  {
    key = line_key( strip_inline_comment(line.text) );
    occurrence = key ? count_occurrences( tree, *key, line.depth ) : 0;
  }

} // namespace yamkeep::internal

inline int yamkeep::count_occurrences( const Node& tree, const std::string& key,
  int max_depth )
{
  if ( max_depth < 0 ) return 0;
  return internal::count_occurrences_from( tree, key, 0, max_depth );
}

inline yamkeep::Annotations yamkeep::extract_annotations(
  const std::string& raw_text, const Node& original_tree )
{
  using internal::LineKind;
  const std::vector< internal::SourceLine > lines
    = internal::classify_lines( raw_text );
  const std::size_t n = lines.size();
  Annotations out;

  // Comment runs, anchored forward to the next content line
  for ( std::size_t i = 0; i < n; ) {
    if ( lines[i].kind != LineKind::Comment ) { ++i; continue; }

    std::vector< std::string > text;
    std::size_t j = i;
    while ( j < n && lines[j].kind == LineKind::Comment ) {
      text.push_back( internal::comment_line_text(lines[j].text) );
      ++j;
    }
    Comment c( internal::join(text, "\n"),
      internal::leading_spaces( lines[i].text ) / 2 );

    std::size_t k = j;
    while ( k < n && lines[k].kind != LineKind::Content ) ++k;
    if ( k < n ) {
      c.trailing_line = internal::strip_inline_comment( lines[k].text );
      c.trailing_line_index = k;
      internal::anchor_on( lines[k], original_tree, c.anchor_key,
        c.anchor_occurrence );
    }
    out.comments.push_back( std::move(c) );
    i = j;
  }

  // Blank-line runs, anchored backward to the previous non-blank line
  for ( std::size_t i = 0; i < n; ) {
    if ( lines[i].kind != LineKind::Blank ) { ++i; continue; }

    std::size_t j = i;
    while ( j < n && lines[j].kind == LineKind::Blank ) ++j;
    BreakLine b( static_cast< int >(j - i) );

    if ( i > 0 ) {
      std::size_t p = i - 1;
      if ( lines[p].kind == LineKind::BlockBody ) p = lines[ p ].owner;
      if ( lines[p].kind == LineKind::Comment ) {
        b.preceding_line = internal::trim( lines[p].text );
      }
      else {
        b.preceding_line = internal::strip_inline_comment( lines[p].text );
        internal::anchor_on( lines[p], original_tree, b.anchor_key,
          b.anchor_occurrence );
      }
    }
    out.break_lines.push_back( std::move(b) );
    i = j;
  }

  return out;
}

//--------------------------------------------------------------------------
// Merge session
//--------------------------------------------------------------------------

inline yamkeep::Node yamkeep::internal::AnnotationMerger::merge() {
  // Comments first: a blank-line run may follow a comment, so the second
  // sweep needs the comment entries in place
  Node with_comments = this->merge_comments( tree_, 0 );
  Node merged = this->place_break_lines( with_comments, 0 );
  this->report_unused();
  return merged;
}

inline yamkeep::Node yamkeep::internal::AnnotationMerger::merge_comments(
  const Node& map, int depth )
{
  Node out = Node::mapping();
  for ( const auto& e : map.entries() ) {
    if ( e.value.is_annotation() ) { out.entries().push_back( e ); continue; }

    const int occ = count_occurrences( tree_, e.key, depth );
    for ( std::size_t i = 0; i < comments_.size(); ++i ) {
      const Comment& c = comments_[ i ];
      if ( comment_used_[i] || c.anchor_key != e.key ) continue;
      if ( c.anchor_occurrence != occ ) continue;
      if ( !value_matches(c.anchor_value(), e.value) ) continue;
      this->take_comment_runs( i, out.entries() );
      break;
    }

    if ( e.value.is_mapping() ) {
      out.entries().push_back(
        Entry{ e.key, this->merge_comments(e.value, depth + 1) } );
    }
    else if ( e.value.is_sequence() ) {
      out.entries().push_back(
        Entry{ e.key, this->merge_comments_in_sequence(e.value, depth + 1) } );
    }
    else {
      out.entries().push_back( e );
    }
  }

  // The comment closing the document has nothing below it to anchor on
  if ( depth == 0 ) {
    for ( std::size_t i = 0; i < comments_.size(); ++i ) {
      if ( comment_used_[i] || !comments_[i].at_document_end() ) continue;
      comment_used_[ i ] = true;
      out.entries().push_back( Entry{ std::string(), Node(comments_[i]) } );
    }
  }
  return out;
}

inline yamkeep::Node
  yamkeep::internal::AnnotationMerger::merge_comments_in_sequence(
    const Node& seq, int depth )
{
  Node out = Node::sequence();
  for ( const auto& e : seq.entries() ) {
    const Node& item = e.value;
    if ( item.is_mapping() ) {
      out.push_back( this->merge_comments(item, depth) );
      continue;
    }
    if ( item.is_scalar() ) {
      for ( std::size_t i = 0; i < comments_.size(); ++i ) {
        const Comment& c = comments_[ i ];
        if ( comment_used_[i] || c.anchor_key || !c.trailing_line ) continue;
        if ( item.is_null() && !trim(*c.anchor_value()).empty() ) continue;
        if ( !value_matches(c.anchor_value(), item) ) continue;
        this->take_comment_runs( i, out.entries() );
        break;
      }
    }
    out.push_back( item );
  }
  return out;
}

// Take comments_[first] and every later unused run that sits above the
// same source line, i.e. runs separated from it only by blank lines
inline void yamkeep::internal::AnnotationMerger::take_comment_runs(
  std::size_t first, std::vector< Entry >& out )
{
  const std::optional< std::size_t > line = comments_[ first ].trailing_line_index;
  for ( std::size_t i = first; i < comments_.size(); ++i ) {
    if ( comment_used_[i] ) continue;
    if ( i != first && (!line || comments_[i].trailing_line_index != line) ) {
      continue;
    }
    comment_used_[ i ] = true;
    out.push_back( Entry{ std::string(), Node(comments_[i]) } );
  }
}

inline yamkeep::Node yamkeep::internal::AnnotationMerger::place_break_lines(
  const Node& map, int depth )
{
  Node out = Node::mapping();
  for ( const auto& e : map.entries() ) {
    if ( e.value.is_comment() ) {
      out.entries().push_back( e );
      this->take_break_lines_after( e.value.get_comment(), out.entries() );
      continue;
    }
    if ( e.value.is_break_line() ) { out.entries().push_back( e ); continue; }

    if ( e.value.is_mapping() ) {
      out.entries().push_back(
        Entry{ e.key, this->place_break_lines(e.value, depth + 1) } );
    }
    else if ( e.value.is_sequence() ) {
      out.entries().push_back( Entry{ e.key,
        this->place_break_lines_in_sequence(e.value, depth + 1) } );
    }
    else {
      out.entries().push_back( e );
    }

    const int occ = count_occurrences( tree_, e.key, depth );
    for ( std::size_t i = 0; i < break_lines_.size(); ++i ) {
      const BreakLine& b = break_lines_[ i ];
      if ( break_used_[i] || b.anchor_key != e.key ) continue;
      if ( b.anchor_occurrence != occ ) continue;
      if ( !value_matches(b.anchor_value(), e.value) ) continue;
      break_used_[ i ] = true;
      out.entries().push_back( Entry{ std::string(), Node(b) } );
      break;
    }
  }

  // Blank lines opening the document
  if ( depth == 0 ) {
    for ( std::size_t i = 0; i < break_lines_.size(); ++i ) {
      if ( break_used_[i] || !break_lines_[i].at_document_start() ) continue;
      break_used_[ i ] = true;
      out.entries().insert( out.entries().begin(),
        Entry{ std::string(), Node(break_lines_[i]) } );
    }
  }
  return out;
}

inline yamkeep::Node
  yamkeep::internal::AnnotationMerger::place_break_lines_in_sequence(
    const Node& seq, int depth )
{
  Node out = Node::sequence();
  for ( const auto& e : seq.entries() ) {
    const Node& item = e.value;
    if ( item.is_comment() ) {
      out.push_back( item );
      this->take_break_lines_after( item.get_comment(), out.entries() );
      continue;
    }
    if ( item.is_mapping() ) {
      out.push_back( this->place_break_lines(item, depth) );
      continue;
    }
    out.push_back( item );
    if ( !item.is_scalar() ) continue;

    for ( std::size_t i = 0; i < break_lines_.size(); ++i ) {
      const BreakLine& b = break_lines_[ i ];
      if ( break_used_[i] || b.anchor_key || !b.preceding_line ) continue;
      if ( b.follows_comment() ) continue;
      if ( item.is_null() && !trim(*b.anchor_value()).empty() ) continue;
      if ( !value_matches(b.anchor_value(), item) ) continue;
      break_used_[ i ] = true;
      out.push_back( Node(b) );
      break;
    }
  }
  return out;
}

inline void yamkeep::internal::AnnotationMerger::take_break_lines_after(
  const Comment& comment, std::vector< Entry >& out )
{
  const std::vector< std::string > lines = comment.lines();
  const std::string last = rtrim( lines.back() );
  for ( std::size_t i = 0; i < break_lines_.size(); ++i ) {
    const BreakLine& b = break_lines_[ i ];
    if ( break_used_[i] || !b.follows_comment() ) continue;
    if ( comment_line_text(*b.preceding_line) != last ) continue;
    break_used_[ i ] = true;
    out.push_back( Entry{ std::string(), Node(b) } );
    return;
  }
}

inline void yamkeep::internal::AnnotationMerger::report_unused() const {
  for ( std::size_t i = 0; i < comments_.size(); ++i ) {
    if ( comment_used_[i] ) continue;
    spdlog::debug( "yamkeep: no anchor for comment '{}' (line '{}'), dropped",
      comments_[i].text, comments_[i].trailing_line.value_or("") );
  }
  for ( std::size_t i = 0; i < break_lines_.size(); ++i ) {
    if ( break_used_[i] ) continue;
    spdlog::debug( "yamkeep: no anchor for {} blank line(s) after '{}', dropped",
      break_lines_[i].count, break_lines_[i].preceding_line.value_or("") );
  }
}

inline yamkeep::Node yamkeep::merge_annotations( const Node& tree,
  const Annotations& annotations )
{
  if ( !tree.is_mapping() ) {
    throw TypeError( "annotations can only be merged into a mapping, found a "
      + internal::type_name(tree.type()) + " node" );
  }
  internal::AnnotationMerger merger( tree, annotations );
  return merger.merge();
}

inline std::string yamkeep::render( const Node& tree ) {
  if ( !tree.is_mapping() ) {
    throw TypeError( "only a mapping can be rendered as a document, found a "
      + internal::type_name(tree.type()) + " node" );
  }
  std::string out;
  internal::render_mapping( tree, 0, -1, out );
  return out;
}

//--------------------------------------------------------------------------
// Document
//--------------------------------------------------------------------------

inline yamkeep::Document::Document( std::string path, DocumentOptions options )
  : path_( std::move(path) ), options_( std::move(options) ),
    root_( Node::mapping() ), original_( Node::mapping() )
{
  if ( options_.temp_suffix.empty() || options_.backup_suffix.empty() ) {
    throw ConfigurationError( "temp and backup suffixes must not be empty" );
  }
  if ( options_.temp_suffix == options_.backup_suffix ) {
    throw ConfigurationError( "temp and backup suffixes must differ (both '"
      + options_.temp_suffix + "')" );
  }
}

inline yamkeep::Document yamkeep::Document::load( const std::string& path,
  DocumentOptions options )
{
  std::error_code ec;
  if ( !std::filesystem::is_regular_file( path, ec ) ) {
    throw IOError( path, "file does not exist" );
  }
  std::ifstream in( path, std::ios::binary );
  if ( !in ) throw IOError( path, "cannot open for reading" );
  return from_stream( in, path, std::move(options) );
}

inline yamkeep::Document yamkeep::Document::from_stream( std::istream& in,
  const std::string& path, DocumentOptions options )
{
  std::ostringstream ss;
  ss << in.rdbuf();
  if ( in.bad() ) throw IOError( path, "read failed" );
  return from_text( ss.str(), path, std::move(options) );
}

inline yamkeep::Document yamkeep::Document::from_text( const std::string& text,
  const std::string& path, DocumentOptions options )
{
  Document doc( path, std::move(options) );

  Node tree = parse( text );
  Annotations annotations = extract_annotations( text, tree );

  // A banner written by an earlier save is emitted again by to_text(), so
  // it is not kept as a comment of its own
  const std::string& banner = doc.options_.banner;
  if ( !banner.empty() && !annotations.comments.empty() ) {
    const std::vector< std::string > first_lines
      = internal::split_lines( text );
    Comment& first = annotations.comments.front();
    std::vector< std::string > lines = first.lines();
    if ( !first_lines.empty() && internal::is_comment_line(first_lines[0])
      && lines.front() == banner )
    {
      lines.erase( lines.begin() );
      if ( lines.empty() ) annotations.comments.erase( annotations.comments.begin() );
      else first.text = internal::join( lines, "\n" );
    }
  }

  doc.root_ = merge_annotations( tree, annotations );
  doc.original_ = std::move( tree );

  spdlog::debug( "yamkeep: loaded '{}' ({} keys, {} comments, {} blank-line runs)",
    path, doc.original_.size(), annotations.comments.size(),
    annotations.break_lines.size() );
  return doc;
}

inline yamkeep::Node yamkeep::Document::get( const std::string& key ) const {
  const Node* value = root_.find( key );
  return value ? *value : Node();
}

inline const yamkeep::Node* yamkeep::Document::find( const std::string& key )
  const
{
  return root_.find( key );
}

inline yamkeep::Node* yamkeep::Document::find( const std::string& key ) {
  return root_.find( key );
}

inline yamkeep::Node& yamkeep::Document::operator[]( const std::string& key ) {
  return root_[ key ];
}

inline void yamkeep::Document::set( const std::string& key, Node value ) {
  root_.set( key, std::move(value) );
}

inline bool yamkeep::Document::erase( const std::string& key ) {
  return root_.erase( key );
}

inline void yamkeep::Document::add_comment( const std::string& text,
  const CommentOptions& opts )
{
  Comment comment( text, opts.indent_level );
  if ( !opts.before_key ) {
    root_.append( Node(std::move(comment)) );
    return;
  }
  if ( !root_.insert_before(*opts.before_key, Node(std::move(comment))) ) {
    throw ConfigurationError( "no key '" + *opts.before_key
      + "' to place the comment before" );
  }
}

inline void yamkeep::Document::add_break_line( int count,
  const std::optional< std::string >& after_key )
{
  BreakLine break_line( count );
  if ( !after_key ) {
    root_.append( Node(break_line) );
    return;
  }
  if ( !root_.insert_after(*after_key, Node(break_line)) ) {
    throw ConfigurationError( "no key '" + *after_key
      + "' to place the break line after" );
  }
}

inline std::string yamkeep::Document::to_text() const {
  std::string out;
  if ( !options_.banner.empty() ) {
    internal::render_comment( Comment(options_.banner), 0, out );
  }
  out += render( root_ );
  return out;
}

// Safe save: write a temp sibling, move the current file to a backup,
// move the temp file into place, then drop the backup. A failure between
// the two renames leaves only the backup behind.
inline std::string yamkeep::Document::save() {
  namespace fs = std::filesystem;
  if ( path_.empty() ) throw IOError( path_, "document has no target path" );

  const std::string text = this->to_text();
  const fs::path target( path_ );
  const fs::path temp( path_ + options_.temp_suffix );
  const fs::path backup( path_ + options_.backup_suffix );

  {
    std::ofstream out( temp, std::ios::binary | std::ios::trunc );
    if ( !out ) throw IOError( temp.string(), "cannot open for writing" );
    out << text;
    out.flush();
    if ( !out ) throw IOError( temp.string(), "write failed" );
  }

  std::error_code ec;
  if ( fs::exists(backup, ec) ) {
    fs::remove( backup, ec );
    if ( ec ) throw IOError( backup.string(), ec.message() );
  }
  const bool had_target = fs::exists( target, ec );
  if ( had_target ) {
    fs::rename( target, backup, ec );
    if ( ec ) throw IOError( path_, "cannot move aside: " + ec.message() );
  }
  fs::rename( temp, target, ec );
  if ( ec ) throw IOError( path_, "cannot replace: " + ec.message() );
  if ( had_target ) {
    fs::remove( backup, ec );
    if ( ec ) {
      spdlog::warn( "yamkeep: saved '{}' but could not remove backup '{}': {}",
        path_, backup.string(), ec.message() );
    }
  }

  spdlog::debug( "yamkeep: saved '{}' ({} bytes)", path_, text.size() );
  return text;
}
