#include <gtest/gtest.h>

#include "yamkeep.hh"

namespace {

  yamkeep::Node merged( const std::string& text ) {
    yamkeep::Node tree = yamkeep::parse( text );
    return yamkeep::merge_annotations( tree,
      yamkeep::extract_annotations(text, tree) );
  }

  // Kinds of the entries of a container, "C" comment, "B" break line,
  // otherwise the key (or "-" for a sequence item)
  std::vector< std::string > layout( const yamkeep::Node& n ) {
    std::vector< std::string > out;
    for ( const auto& e : n.entries() ) {
      if ( e.value.is_comment() ) out.push_back( "C" );
      else if ( e.value.is_break_line() ) out.push_back( "B" );
      else out.push_back( n.is_sequence() ? "-" : e.key );
    }
    return out;
  }

}

TEST(MergeTest, CommentLandsBeforeItsKey) {
  yamkeep::Node root = merged( "# greeting comment\nhello: world\n" );
  std::vector< std::string > expected{ "C", "hello" };
  EXPECT_EQ( layout(root), expected );
  EXPECT_EQ( root.entries()[0].value.get_comment().text, "greeting comment" );
}

TEST(MergeTest, BreakLineLandsAfterItsKey) {
  yamkeep::Node root = merged( "key: null\n\n\nother: 1\n" );
  std::vector< std::string > expected{ "key", "B", "other" };
  ASSERT_EQ( layout(root), expected );
  EXPECT_EQ( root.entries()[1].value.get_break_line().count, 2 );
}

TEST(MergeTest, NestedAnnotationsStayInTheirMapping) {
  yamkeep::Node root = merged(
    "server:\n"
    "  host: a\n"
    "  # port\n"
    "  port: 1\n"
    "\n"
    "client: 2\n" );
  std::vector< std::string > top{ "server", "client" };
  EXPECT_EQ( layout(root), top );
  std::vector< std::string > inner{ "host", "C", "port", "B" };
  EXPECT_EQ( layout(root.at("server")), inner );
}

TEST(MergeTest, RepeatedKeyCommentGoesToTheMatchingItem) {
  yamkeep::Node root = merged(
    "team:\n"
    "  - name: alice\n"
    "  # second member\n"
    "  - name: bob\n" );
  const yamkeep::Node& team = root.at( "team" );
  ASSERT_EQ( team.size(), 2u );
  std::vector< std::string > first{ "name" };
  std::vector< std::string > second{ "C", "name" };
  EXPECT_EQ( layout(team.at(std::size_t(0))), first );
  EXPECT_EQ( layout(team.at(std::size_t(1))), second );
}

TEST(MergeTest, ScalarSequenceItemsCarryAnnotations) {
  yamkeep::Node root = merged(
    "list:\n"
    "  - a\n"
    "\n"
    "  # before b\n"
    "  - b\n" );
  std::vector< std::string > expected{ "-", "B", "C", "-" };
  EXPECT_EQ( layout(root.at("list")), expected );
}

TEST(MergeTest, DocumentEdgesAreKept) {
  yamkeep::Node root = merged( "\na: 1\n# the end\n" );
  std::vector< std::string > expected{ "B", "a", "C" };
  EXPECT_EQ( layout(root), expected );
}

TEST(MergeTest, BlankLineAfterCommentFollowsTheComment) {
  yamkeep::Node root = merged( "# header\n\na: 1\n" );
  std::vector< std::string > expected{ "C", "B", "a" };
  EXPECT_EQ( layout(root), expected );
}

TEST(MergeTest, EachAnnotationIsPlacedOnce) {
  yamkeep::Node root = merged(
    "a:\n"
    "# about b\n"
    "b:\n"
    "c:\n" );
  int comments = 0;
  for ( const auto& e : root.entries() ) {
    if ( e.value.is_comment() ) ++comments;
  }
  EXPECT_EQ( comments, 1 );
  std::vector< std::string > expected{ "a", "C", "b", "c" };
  EXPECT_EQ( layout(root), expected );
}

TEST(MergeTest, UnanchoredAnnotationsAreDropped) {
  yamkeep::Node tree = yamkeep::parse( "a: 1\n" );
  yamkeep::Annotations ann;
  yamkeep::Comment orphan( "orphan" );
  orphan.anchor_key = "gone";
  orphan.anchor_occurrence = 1;
  orphan.trailing_line = "gone: 2";
  ann.comments.push_back( orphan );

  yamkeep::Node root = yamkeep::merge_annotations( tree, ann );
  EXPECT_EQ( root, tree );
}

TEST(MergeTest, MismatchedValueIsNotAnchored) {
  yamkeep::Node tree = yamkeep::parse( "a: 1\n" );
  yamkeep::Annotations ann;
  yamkeep::Comment c( "stale" );
  c.anchor_key = "a";
  c.anchor_occurrence = 1;
  c.trailing_line = "a: 2";
  ann.comments.push_back( c );

  EXPECT_EQ( yamkeep::merge_annotations(tree, ann).entries().size(), 1u );
}

TEST(MergeTest, QuotedAndUnquotedValuesMatch) {
  yamkeep::Node root = merged( "# quoted\nname: \"demo\"\n# flag\nflag: TRUE\n" );
  std::vector< std::string > expected{ "C", "name", "C", "flag" };
  EXPECT_EQ( layout(root), expected );
}

TEST(MergeTest, RequiresAMapping) {
  EXPECT_THROW( yamkeep::merge_annotations( yamkeep::Node::sequence(),
    yamkeep::Annotations() ), yamkeep::TypeError );
}

TEST(MergeTest, RepeatedNullKeysKeepTheirOwnComments) {
  yamkeep::Node root = merged(
    "a:\n"
    "  # c1\n"
    "  k:\n"
    "b:\n"
    "  # c2\n"
    "  k:\n" );
  const yamkeep::Node& a = root.at( "a" );
  const yamkeep::Node& b = root.at( "b" );
  std::vector< std::string > expected{ "C", "k" };
  ASSERT_EQ( layout(a), expected );
  ASSERT_EQ( layout(b), expected );
  EXPECT_EQ( a.entries()[0].value.get_comment().text, "c1" );
  EXPECT_EQ( b.entries()[0].value.get_comment().text, "c2" );
}

TEST(MergeTest, RepeatedMappingKeysInSequenceItemsKeepTheirOwnComments) {
  yamkeep::Node root = merged(
    "list:\n"
    "  # first\n"
    "  - name:\n"
    "      x: 1\n"
    "  # second\n"
    "  - name:\n"
    "      x: 2\n" );
  const yamkeep::Node& list = root.at( "list" );
  ASSERT_EQ( list.size(), 2u );
  const yamkeep::Node& first = list.at( std::size_t(0) );
  const yamkeep::Node& second = list.at( std::size_t(1) );
  std::vector< std::string > expected{ "C", "name" };
  ASSERT_EQ( layout(first), expected );
  ASSERT_EQ( layout(second), expected );
  EXPECT_EQ( first.entries()[0].value.get_comment().text, "first" );
  EXPECT_EQ( second.entries()[0].value.get_comment().text, "second" );
}

TEST(MergeTest, RepeatedKeysKeepTheirOwnBlankLines) {
  yamkeep::Node root = merged(
    "a:\n"
    "  k:\n"
    "\n"
    "b:\n"
    "  k:\n"
    "\n"
    "\n"
    "c: 1\n" );
  std::vector< std::string > expected{ "k", "B" };
  ASSERT_EQ( layout(root.at("a")), expected );
  ASSERT_EQ( layout(root.at("b")), expected );
  EXPECT_EQ( root.at("a").entries()[1].value.get_break_line().count, 1 );
  EXPECT_EQ( root.at("b").entries()[1].value.get_break_line().count, 2 );
}

TEST(MergeTest, RepeatedNullItemsInSequencesKeepTheirOwnAnnotations) {
  yamkeep::Node root = merged(
    "list:\n"
    "  # one\n"
    "  - id:\n"
    "\n"
    "  # two\n"
    "  - id:\n"
    "\n"
    "\n"
    "after: 1\n" );
  const yamkeep::Node& list = root.at( "list" );
  ASSERT_EQ( list.size(), 2u );
  std::vector< std::string > expected{ "C", "id", "B" };
  ASSERT_EQ( layout(list.at(std::size_t(0))), expected );
  ASSERT_EQ( layout(list.at(std::size_t(1))), expected );
  EXPECT_EQ( list.at(std::size_t(0)).entries()[0].value.get_comment().text, "one" );
  EXPECT_EQ( list.at(std::size_t(1)).entries()[0].value.get_comment().text, "two" );
  EXPECT_EQ( list.at(std::size_t(0)).entries()[2].value.get_break_line().count, 1 );
  EXPECT_EQ( list.at(std::size_t(1)).entries()[2].value.get_break_line().count, 2 );
}

TEST(MergeTest, CommentRunsAboveTheSameLineStayTogether) {
  yamkeep::Node root = merged(
    "# one\n"
    "\n"
    "# two\n"
    "k: 1\n"
    "# three\n"
    "k2: 2\n" );
  std::vector< std::string > expected{ "C", "B", "C", "k", "C", "k2" };
  EXPECT_EQ( layout(root), expected );
}
