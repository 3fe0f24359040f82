#include <gtest/gtest.h>

#include "yamkeep.hh"

using yamkeep::Node;

class NodeTest : public ::testing::Test {
protected:
  void SetUp() override {
    map = Node::mapping();
    map.set( "name", "demo" );
    map.set( "port", 8080 );
    map.set( "debug", false );
  }

  Node map;
};

TEST_F(NodeTest, ScalarConstructorsPickTheRightType) {
  EXPECT_TRUE( Node().is_null() );
  EXPECT_TRUE( Node( nullptr ).is_null() );
  EXPECT_TRUE( Node( true ).is_boolean() );
  EXPECT_TRUE( Node( 3 ).is_integer() );
  EXPECT_TRUE( Node( 3L ).is_integer() );
  EXPECT_TRUE( Node( 2.5 ).is_float_number() );
  EXPECT_TRUE( Node( "text" ).is_string() );
  EXPECT_TRUE( Node( std::string("text") ).is_string() );
  EXPECT_EQ( Node( 42 ).get_integer(), 42 );
  EXPECT_DOUBLE_EQ( Node( 2.5 ).get_float(), 2.5 );
  EXPECT_EQ( Node( "text" ).get_string(), "text" );
}

TEST_F(NodeTest, TypedAccessorThrowsOnMismatch) {
  EXPECT_THROW( Node( 1 ).get_string(), yamkeep::TypeError );
  EXPECT_THROW( Node( "x" ).get_integer(), yamkeep::TypeError );
  EXPECT_THROW( Node().entries(), yamkeep::TypeError );
}

TEST_F(NodeTest, MappingKeepsInsertionOrder) {
  std::vector< std::string > expected{ "name", "port", "debug" };
  EXPECT_EQ( map.keys(), expected );
  EXPECT_EQ( map.size(), 3u );
  EXPECT_TRUE( map.contains("port") );
  EXPECT_FALSE( map.contains("missing") );
  EXPECT_EQ( map.find("missing"), nullptr );
  EXPECT_THROW( map.at("missing"), std::out_of_range );
}

TEST_F(NodeTest, SetReplacesValueInPlace) {
  map.set( "port", 9090 );
  std::vector< std::string > expected{ "name", "port", "debug" };
  EXPECT_EQ( map.keys(), expected );
  EXPECT_EQ( map.at("port").get_integer(), 9090 );
}

TEST_F(NodeTest, AnnotationsAreInvisibleToLookupAndSize) {
  ASSERT_TRUE( map.insert_before("port", Node(yamkeep::Comment("listen port"))) );
  ASSERT_TRUE( map.insert_after("port", Node(yamkeep::BreakLine(2))) );
  EXPECT_EQ( map.size(), 3u );
  EXPECT_EQ( map.entries().size(), 5u );
  EXPECT_TRUE( map.entries()[1].value.is_comment() );
  EXPECT_TRUE( map.entries()[1].key.empty() );
  EXPECT_TRUE( map.entries()[3].value.is_break_line() );
  EXPECT_FALSE( map.contains("") );
  EXPECT_FALSE( map.insert_before("missing", Node(yamkeep::Comment("x"))) );
}

TEST_F(NodeTest, AnnotationCannotBeAValue) {
  EXPECT_THROW( map.set("c", Node(yamkeep::Comment("x"))),
    yamkeep::ConfigurationError );
  EXPECT_THROW( map.append(Node(1)), yamkeep::ConfigurationError );
}

TEST_F(NodeTest, EraseRemovesOnlyTheEntry) {
  map.insert_before( "port", Node(yamkeep::Comment("listen port")) );
  EXPECT_TRUE( map.erase("port") );
  EXPECT_FALSE( map.erase("port") );
  EXPECT_EQ( map.size(), 2u );
  EXPECT_EQ( map.entries().size(), 3u );
}

TEST_F(NodeTest, SequenceIndexSkipsAnnotations) {
  Node seq = Node::sequence();
  seq.push_back( Node(yamkeep::Comment("first")) );
  seq.push_back( "a" );
  seq.push_back( Node(yamkeep::BreakLine()) );
  seq.push_back( "b" );
  EXPECT_EQ( seq.size(), 2u );
  EXPECT_EQ( seq.at(std::size_t(0)).get_string(), "a" );
  EXPECT_EQ( seq.at(std::size_t(1)).get_string(), "b" );
  EXPECT_THROW( seq.at(std::size_t(2)), std::out_of_range );
}

TEST_F(NodeTest, IndexOperatorTurnsNullIntoMapping) {
  Node n;
  n["outer"]["inner"] = 5;
  ASSERT_TRUE( n.is_mapping() );
  EXPECT_EQ( n.at("outer").at("inner").get_integer(), 5 );
}

TEST_F(NodeTest, WithoutAnnotationsStripsEveryLevel) {
  Node inner = Node::mapping();
  inner.set( "x", 1 );
  inner.append( Node(yamkeep::Comment("trailing")) );
  map.set( "inner", inner );
  map.insert_before( "name", Node(yamkeep::BreakLine()) );

  Node plain = map.without_annotations();
  EXPECT_EQ( plain.entries().size(), 4u );
  EXPECT_EQ( plain.at("inner").entries().size(), 1u );
  EXPECT_NE( plain, map );
}

TEST(AnnotationTest, BreakLineCountMustBePositive) {
  EXPECT_THROW( yamkeep::BreakLine( 0 ), yamkeep::ConfigurationError );
  EXPECT_THROW( yamkeep::BreakLine( -3 ), yamkeep::ConfigurationError );
  EXPECT_EQ( yamkeep::BreakLine( 4 ).count, 4 );
}

TEST(AnnotationTest, CommentIndentMustNotBeNegative) {
  EXPECT_THROW( yamkeep::Comment( "x", -1 ), yamkeep::ConfigurationError );
  yamkeep::Comment c( "a\nb", 2 );
  std::vector< std::string > expected{ "a", "b" };
  EXPECT_EQ( c.lines(), expected );
  EXPECT_TRUE( c.at_document_end() );
}

TEST(AnnotationTest, AnchorValueComesFromTheRecordedLine) {
  yamkeep::Comment c( "note" );
  c.anchor_key = "port";
  c.trailing_line = "  port: 8080";
  EXPECT_EQ( c.anchor_value(), std::optional< std::string >( "8080" ) );

  yamkeep::BreakLine b;
  b.preceding_line = "# heading";
  EXPECT_TRUE( b.follows_comment() );
  EXPECT_FALSE( b.anchor_value().has_value() );
  EXPECT_FALSE( b.at_document_start() );
}
