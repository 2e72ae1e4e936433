// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Покрытие:
// - Writer: создание, сообщения с префиксами, режимы quiet/verbose
// - JSON вывод сводки hunt
// - Table: таблица сводки hunt
// - вывод в файл (--output)
//
// ==============================================================================

#include <fleethunt/output.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

namespace fleethunt::output::test {

// ==============================================================================
// Writer
// ==============================================================================

TEST(OutputTest, Writer_DefaultConfig_CreatesSuccessfully) {
    OutputConfig config;
    EXPECT_NO_THROW({ Writer writer(config); });
}

TEST(OutputTest, Writer_Messages_DoNotThrow) {
    OutputConfig config;
    config.verbose = 2;
    Writer writer(config);

    EXPECT_NO_THROW({
        writer.info("hunt H:00000001 started");
        writer.warn("client C.1000000000000101 hanging");
        writer.error("dispatch failed");
        writer.debug("rule matched");
        writer.trace("check-in");
    });
}

TEST(OutputTest, Writer_QuietMode_DoesNotThrow) {
    OutputConfig config;
    config.quiet = true;
    Writer writer(config);
    EXPECT_NO_THROW({
        writer.info("suppressed");
        writer.error("still printed");
    });
}

// ==============================================================================
// Форматирование
// ==============================================================================

TEST(OutputTest, FormatNumber_TrimsTrailingZeros) {
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(2.0), "2");
    EXPECT_EQ(format_number(1.23456789, 3), "1.235");
    EXPECT_EQ(format_number(0.0), "0");
}

TEST(OutputTest, AnsiCodes_NotEmpty) {
    EXPECT_FALSE(ansi_color_code(Color::Red).empty());
}

// ==============================================================================
// JSON
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_DoesNotThrow) {
    OutputConfig config;
    Writer writer(config);

    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("hunt_id", "H:00000001", doc.GetAllocator());
    doc.AddMember("clients", 10, doc.GetAllocator());

    EXPECT_NO_THROW(writer.write_json_pretty(doc));
}

// ==============================================================================
// Table
// ==============================================================================

TEST(OutputTest, Table_SummaryContainsHeadersAndCells) {
    Table table;
    table.set_headers({"hunt", "started", "completed", "errors"});
    table.add_row({"H:00000001", "10", "7", "1"});

    std::string result = table.to_string();

    EXPECT_NE(result.find("hunt"), std::string::npos);
    EXPECT_NE(result.find("H:00000001"), std::string::npos);
    EXPECT_NE(result.find("completed"), std::string::npos);
    // ┌ и └ (UTF-8)
    EXPECT_NE(result.find("\xe2\x94\x8c"), std::string::npos);
    EXPECT_NE(result.find("\xe2\x94\x94"), std::string::npos);
    EXPECT_EQ(table.row_count(), 1u);
}

TEST(OutputTest, Table_ToString_Deterministic) {
    Table a;
    Table b;
    for (Table* t : {&a, &b}) {
        t->set_headers({"client", "cpu"});
        t->add_row({"C.1", "0.5"});
        t->add_row({"C.2", "1.25"});
    }
    EXPECT_EQ(a.to_string(), b.to_string());
}

// ==============================================================================
// Вывод в файл
// ==============================================================================

TEST(OutputTest, Writer_HasOutputFile_FalseByDefault) {
    OutputConfig config;
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

TEST(OutputTest, Writer_OutputFile_ReceivesStdout) {
    auto path = std::filesystem::temp_directory_path() / "fleethunt_output_test.txt";
    std::filesystem::remove(path);

    {
        OutputConfig config;
        config.output_path = path;
        Writer writer(config);
        ASSERT_TRUE(writer.has_output_file());
        writer.write_line(Stream::Stdout, "hunt summary");
    }

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "hunt summary\n");

    in.close();
    std::filesystem::remove(path);
}

TEST(OutputTest, Writer_OutputFile_UnwritablePath) {
    OutputConfig config;
    config.output_path = std::filesystem::path("/nonexistent-dir/fleethunt/out.txt");
    Writer writer(config);
    EXPECT_FALSE(writer.has_output_file());
}

}  // namespace fleethunt::output::test
