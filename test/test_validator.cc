#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <config.h>
#include <except.h>
#include <naming_convention.h>
#include <validator.h>

#include "config_guard.h"

using namespace nameguard;

class Validator : public ConfigGuard {};

TEST_F(Validator, OperationKeyword) {
    EXPECT_EQ(validateOperation("class"), "aClass");
    EXPECT_EQ(validateOperation("list"), "aList");
    EXPECT_EQ(validateOperation("Echo"), "aEcho");
}

TEST_F(Validator, OperationPlain) {
    EXPECT_EQ(validateOperation("getWidget"), "getWidget");
    EXPECT_EQ(validateOperation("get-widget"), "getwidget");
    EXPECT_EQ(validateOperation("1stCall"), "a1stCall");
}

TEST_F(Validator, ConstantKeyword) {
    EXPECT_EQ(validateConstant("default"), "aDefault");
    EXPECT_EQ(validateConstant("NEW"), "aNEW");
    EXPECT_EQ(validateConstant("MAX_SIZE"), "MAX_SIZE");
    EXPECT_EQ(validateConstant("1st"), "a1st");
}

TEST_F(Validator, AttributeKeepsKeywords) {
    EXPECT_EQ(validateAttribute("class"), "class");
    EXPECT_EQ(validateAttribute("return"), "return");
    EXPECT_EQ(validateAttribute("first name"), "firstname");
    EXPECT_EQ(validateAttribute("École"), "Ecole");
}

TEST_F(Validator, ClassPlain) {
    EXPECT_EQ(validateClass("Widget", nullptr), "Widget");
    EXPECT_EQ(validateClass("my-widget", nullptr), "mywidget");
}

TEST_F(Validator, ClassKeyword) {
    EXPECT_EQ(validateClass("Return", nullptr), "ReturnCustom");
    EXPECT_EQ(validateClass("list", nullptr), "listCustom");
}

TEST_F(Validator, ClassExisting) {
    SymbolRegistry registry{"Widget"};
    EXPECT_EQ(validateClass("Widget", registry), "WidgetCustom");
    EXPECT_EQ(validateClass("WIDGET", registry), "WIDGETCustom");

    registry.declare("WidgetCustom");
    EXPECT_EQ(validateClass("Widget", registry), "WidgetCustom2");
}

TEST_F(Validator, ClassKeywordAndExisting) {
    SymbolRegistry registry{"ArrayCustom"};
    EXPECT_EQ(validateClass("Array", registry), "ArrayCustom2");
}

TEST_F(Validator, ClassNamespace) {
    SymbolRegistry registry{"App\\Widget"};
    EXPECT_EQ(validateClass("Widget", registry, "App"), "WidgetCustom");
    EXPECT_EQ(validateClass("Widget", registry, "Other"), "Widget");
    EXPECT_EQ(validateClass("Widget", registry), "Widget");
}

TEST_F(Validator, ClassPredicateSeesQualifiedNames) {
    std::vector<std::string> asked;
    auto name = validateClass(
        "Widget",
        [&](const std::string &qualified) {
            asked.emplace_back(qualified);
            return asked.size() < 3;
        },
        "App\\Model");
    EXPECT_EQ(name, "WidgetCustom2");
    EXPECT_EQ(asked, (std::vector<std::string>{"App\\Model\\Widget",
                                                "App\\Model\\WidgetCustom",
                                                "App\\Model\\WidgetCustom2"}));
}

TEST_F(Validator, ClassCustomSuffix) {
    Config::setNameSuffix("Type");
    EXPECT_EQ(validateClass("Return", nullptr), "ReturnType");
}

TEST_F(Validator, TypeMapping) {
    EXPECT_EQ(validateType("nonNegativeInteger"), "int");
    EXPECT_EQ(validateType("unsignedShort"), "int");
    EXPECT_EQ(validateType("double"), "float");
    EXPECT_EQ(validateType("token"), "string");
    EXPECT_EQ(validateType("dateTime"), "\\DateTime");
}

TEST_F(Validator, TypeArray) {
    EXPECT_EQ(validateType("Widget[]"), "Widget[]");
    EXPECT_EQ(validateType("my-widget[]"), "mywidget[]");
    EXPECT_EQ(validateType("1Widget[]"), "a1Widget[]");
    // Elements are not mapped
    EXPECT_EQ(validateType("string[]"), "string[]");
}

TEST_F(Validator, TypeCustom) {
    EXPECT_EQ(validateType("Widget"), "Widget");
    EXPECT_EQ(validateType("tns:Widget"), "tnsWidget");
    EXPECT_EQ(validateType("boolean"), "boolean");
}

TEST_F(Validator, TypeKeyword) {
    EXPECT_EQ(validateType("Array"), "ArrayCustom");
    EXPECT_EQ(validateType("list"), "listCustom");
    Config::setNameSuffix("Type");
    EXPECT_EQ(validateType("list"), "listType");
}

TEST_F(Validator, TypeHint) {
    EXPECT_EQ(validateTypeHint("Widget[]"), "array");
    EXPECT_EQ(validateTypeHint("int[]"), "array");
    EXPECT_EQ(validateTypeHint("\\DateTime"), "\\DateTime");
    EXPECT_EQ(validateTypeHint("dateTime"), "\\DateTime");
    EXPECT_FALSE(validateTypeHint("string").has_value());
    EXPECT_FALSE(validateTypeHint("int").has_value());
    EXPECT_FALSE(validateTypeHint("Widget").has_value());
    EXPECT_FALSE(validateTypeHint("").has_value());
}

TEST_F(Validator, TypeHintOfValidatedType) {
    EXPECT_EQ(validateTypeHint(validateType("dateTime")), "\\DateTime");
    EXPECT_EQ(validateTypeHint(validateType("Widget[]")), "array");
    EXPECT_FALSE(validateTypeHint(validateType("long")).has_value());
}

TEST_F(Validator, CustomPrefix) {
    Config::setNamePrefix("x");
    EXPECT_EQ(validateOperation("class"), "xClass");
    EXPECT_EQ(validateConstant("1st"), "x1st");
}

TEST_F(Validator, DispatchByCategory) {
    EXPECT_EQ(validateName("class", NameCategory::Class), "classCustom");
    EXPECT_EQ(validateName("class", NameCategory::Operation), "aClass");
    EXPECT_EQ(validateName("class", NameCategory::Attribute), "class");
    EXPECT_EQ(validateName("class", NameCategory::Constant), "aClass");
    EXPECT_EQ(validateName("class", NameCategory::Type), "classCustom");
    EXPECT_EQ(validateName("dateTime", NameCategory::Type), "\\DateTime");

    SymbolRegistry registry{"App\\Widget"};
    EXPECT_EQ(validateName("Widget", NameCategory::Class,
                           registry.existence(), "App"),
              "WidgetCustom");
}

TEST_F(Validator, EmptyInputUnderWerror) {
    Config::setWerror();
    EXPECT_EQ(validateAttribute(""), "a");
    EXPECT_EQ(validateType("[]"), "a[]");
    EXPECT_THROW(validateAttribute("***"), Error);
}

TEST_F(Validator, IllegalPrefixOrSuffixRejected) {
    EXPECT_THROW(Config::setNamePrefix(""), InvalidConfig);
    EXPECT_THROW(Config::setNamePrefix("1"), InvalidConfig);
    EXPECT_THROW(Config::setNameSuffix("-x"), InvalidConfig);
    EXPECT_EQ(validateOperation("class"), "aClass");
    EXPECT_EQ(validateConstant("default"), "aDefault");
    EXPECT_EQ(validateClass("return", nullptr), "returnCustom");
    EXPECT_EQ(validateType("array"), "arrayCustom");
}

TEST_F(Validator, RenamedOutputIsFreeIdentifier) {
    Config::setNamePrefix("_");
    Config::setNameSuffix("_2");
    for (auto &&name : {"class", "default", "list", "Return"}) {
        for (auto &&result :
             {validateOperation(name), validateConstant(name),
              validateClass(name, nullptr), validateType(name)}) {
            EXPECT_TRUE(isIdentifier(result)) << result;
            EXPECT_FALSE(isKeyword(result)) << result;
        }
    }
}

TEST_F(Validator, RenameIntoKeywordIsError) {
    Config::setNamePrefix("end");
    EXPECT_THROW(validateOperation("for"), InvalidName);
    try {
        validateConstant("while");
        FAIL() << "InvalidName expected";
    } catch (const InvalidName &e) {
        EXPECT_EQ(e.rawName(), "while");
    }
    EXPECT_EQ(validateOperation("class"), "endClass");

    Config::reset();
    Config::setNameSuffix("_once");
    EXPECT_THROW(validateType("include"), InvalidName);
    // Classes retry instead
    EXPECT_EQ(validateClass("include", nullptr), "include_once2");
}

TEST_F(Validator, LogRename) {
    Config::setLogRename();
    testing::internal::CaptureStderr();
    EXPECT_EQ(validateOperation("class"), "aClass");
    EXPECT_EQ(validateClass("Return", nullptr), "ReturnCustom");
    auto output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("\"class\" to \"aClass\""), std::string::npos);
    EXPECT_NE(output.find("\"ReturnCustom\""), std::string::npos);
}

TEST_F(Validator, NoLogByDefault) {
    testing::internal::CaptureStderr();
    EXPECT_EQ(validateOperation("class"), "aClass");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}
