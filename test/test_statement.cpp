#include <gtest/gtest.h>
#include <vector>

#include <pdsl/core/Statement.h>

using namespace pdsl;

namespace {

Label make_label() {
  return Label{
    Attribute{"PDS_VERSION_ID", Identifier{"PDS3"}},
    Attribute{"record_type", Identifier{"FIXED_LENGTH"}},
    Group{"params", {Attribute{"gain", 2}}},
    Object{"image", {Attribute{"lines", 1024}, Group{"window", {Attribute{"x", 0}}}}}
  };
}

std::vector<String> identifiers(const Label& label) {
  std::vector<String> result;
  for (auto& statement : label)
    result.push_back(statement.identifier().to_str());
  return result;
}

} // namespace

TEST(Statement, Kinds) {
  Statement attr{Attribute{"a", 1}};
  Statement group{Group{"g"}};
  Statement object{Object{"o"}};
  EXPECT_EQ(attr.type(), Statement::ATTRIBUTE_IX);
  EXPECT_EQ(group.type_name(), "group");
  EXPECT_EQ(object.kind(), OBJECT);
  EXPECT_TRUE(attr.is_type<Attribute>());
  EXPECT_THROW(attr.as<Group>(), WrongType);
  EXPECT_EQ(group.identifier(), Identifier{"G"});
}

TEST(Statement, BlockIdentifiersArePlain) {
  EXPECT_THROW(Group{"^g"}, ValidationError);
  EXPECT_THROW(Object{"ns:o"}, ValidationError);
  EXPECT_NO_THROW(Attribute("^image", 12));
}

TEST(Statements, Construction) {
  auto label = make_label();
  EXPECT_EQ(label.size(), 4);
  EXPECT_EQ(identifiers(label), (std::vector<String>{"PDS_VERSION_ID", "RECORD_TYPE", "PARAMS", "IMAGE"}));
}

TEST(Statements, Index) {
  auto label = make_label();
  EXPECT_EQ(label.get(0).identifier(), Identifier{"PDS_VERSION_ID"});
  EXPECT_EQ(label.get(-1).identifier(), Identifier{"IMAGE"});
  EXPECT_THROW(label.get(4), IndexError);
  EXPECT_THROW(label.get(-5), IndexError);
}

TEST(Statements, InsertAppendPop) {
  auto label = make_label();
  label.insert(1, Attribute{"first", 1});
  label.insert(-1, Attribute{"before_last", 2});
  label.insert(label.size(), Attribute{"last", 3});
  label.append(Attribute{"appended", 4});
  EXPECT_EQ(identifiers(label), (std::vector<String>{
    "PDS_VERSION_ID", "FIRST", "RECORD_TYPE", "PARAMS", "BEFORE_LAST", "IMAGE", "LAST", "APPENDED"}));

  EXPECT_EQ(label.pop().identifier(), Identifier{"APPENDED"});
  EXPECT_EQ(label.pop(1).identifier(), Identifier{"FIRST"});
  EXPECT_EQ(label.size(), 6);
  EXPECT_THROW(label.insert(label.size() + 1, Attribute{"x", 1}), IndexError);
  EXPECT_THROW(Label{}.pop(), IndexError);
}

TEST(Statements, SetByIndex) {
  auto label = make_label();
  label.set(0, Attribute{"replaced", 1});
  EXPECT_EQ(label.get(0).identifier(), Identifier{"REPLACED"});
  EXPECT_EQ(label.size(), 4);
}

TEST(Statements, CaseInsensitiveLookup) {
  auto label = make_label();
  label.append(Attribute{"inserted_attr", 7});
  EXPECT_TRUE(label.contains("inserted_attr"));
  EXPECT_TRUE(label.contains("InSeRtEd_AtTr"));
  EXPECT_EQ(&label.get("inserted_attr"), &label.get("InSeRtEd_AtTr"));
  EXPECT_EQ(label.value("INSERTED_ATTR").to_int(), 7);
  EXPECT_FALSE(label.contains("missing"));
  EXPECT_THROW(label.get("missing"), IdentifierNotFound);
}

TEST(Statements, FirstMatchWins) {
  Label label{Attribute{"dup", 1}, Attribute{"dup", 2}};
  EXPECT_EQ(label.value("dup").to_int(), 1);
  EXPECT_EQ(*label.index_of("dup"), 0);
  label.del("dup");
  EXPECT_EQ(label.value("dup").to_int(), 2);
}

TEST(Statements, SetExistingPreservesPosition) {
  auto label = make_label();
  label.set("record_type", Identifier{"STREAM"});
  EXPECT_EQ(label.size(), 4);
  EXPECT_EQ(label.index_of("RECORD_TYPE"), 1);
  EXPECT_EQ(label.value("record_type"), Value{Identifier{"STREAM"}});
}

TEST(Statements, SetNewAppends) {
  auto label = make_label();
  label.set("new_attr", Text{"hello"});
  EXPECT_EQ(label.size(), 5);
  EXPECT_EQ(label.get(-1).identifier(), Identifier{"NEW_ATTR"});
  EXPECT_EQ(label.value("new_attr").as<Text>().value(), "hello");
}

TEST(Statements, SetBlocks) {
  auto label = make_label();
  label.set("params", GroupStatements{Attribute{"gain", 4}, Attribute{"offset", 1}});
  EXPECT_EQ(label.size(), 4);
  auto& params = label.get(2).as<Group>();
  EXPECT_EQ(params.statements().size(), 2);
  EXPECT_EQ(params.statements().value("gain").to_int(), 4);

  label.set("record_type", ObjectStatements{});
  EXPECT_TRUE(label.get(1).is_type<Object>());

  label.set("table", ObjectStatements{Attribute{"rows", 3}});
  EXPECT_EQ(label.size(), 5);
  EXPECT_EQ(label.get("table").as<Object>().statements().value("rows").to_int(), 3);

  EXPECT_THROW(label.set("^ptr", GroupStatements{}), ValidationError);
}

TEST(Statements, DeleteByIdentifier) {
  auto label = make_label();
  label.del("Record_Type");
  EXPECT_EQ(label.size(), 3);
  EXPECT_FALSE(label.contains("record_type"));
  EXPECT_EQ(identifiers(label), (std::vector<String>{"PDS_VERSION_ID", "PARAMS", "IMAGE"}));
  EXPECT_THROW(label.del("record_type"), IdentifierNotFound);
}

TEST(Statements, GroupAcceptsOnlyAttributes) {
  GroupStatements group;
  group.append(Attribute{"a", 1});
  EXPECT_THROW(group.append(Group{"g"}), ValidationError);
  EXPECT_THROW(group.insert(0, Object{"o"}), ValidationError);
  EXPECT_THROW(group.set(0, Object{"o"}), ValidationError);
  EXPECT_THROW(group.set("g", GroupStatements{}), ValidationError);
  EXPECT_THROW((GroupStatements{Attribute{"a", 1}, Object{"o"}}), ValidationError);
  EXPECT_EQ(group.size(), 1);

  try {
    group.append(Object{"nested"});
    FAIL();
  } catch (const ValidationError& e) {
    EXPECT_NE(std::string{e.what()}.find("object"), std::string::npos);
  }
}

TEST(Statements, ObjectAcceptsAll) {
  ObjectStatements object;
  object.append(Attribute{"a", 1});
  object.append(Group{"g"});
  object.append(Object{"o", {Object{"deeper", {Object{"deepest"}}}}});
  EXPECT_EQ(object.size(), 3);
}

TEST(Statements, ReverseIteration) {
  auto label = make_label();
  std::vector<String> ids;
  for (auto& statement : label.reversed())
    ids.push_back(statement.identifier().to_str());
  EXPECT_EQ(ids, (std::vector<String>{"IMAGE", "PARAMS", "RECORD_TYPE", "PDS_VERSION_ID"}));

  ids.clear();
  for (auto it = label.rbegin(); it != label.rend(); ++it)
    ids.push_back(it->identifier().to_str());
  EXPECT_EQ(ids.size(), 4);
  EXPECT_EQ(ids.front(), "IMAGE");
}

TEST(Statements, NestedMutation) {
  auto label = make_label();
  auto& image = label.get("image").as<Object>().statements();
  image.set("lines", 2048);
  image.get("window").as<Group>().statements().set("y", 5);
  EXPECT_EQ(label.get("IMAGE").as<Object>().statements().value("LINES").to_int(), 2048);
  EXPECT_TRUE(label.get("IMAGE").as<Object>().statements().get("WINDOW").as<Group>().statements().contains("Y"));
}

TEST(Statements, DeepCopy) {
  auto a = make_label();
  auto b = a;
  b.get("image").as<Object>().statements().set("lines", 1);
  EXPECT_EQ(a.get("image").as<Object>().statements().value("lines").to_int(), 1024);
  EXPECT_FALSE(a == b);
  EXPECT_TRUE(a == make_label());
}
