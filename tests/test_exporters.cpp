#include <gtest/gtest.h>

#include <QTemporaryDir>
#include <vector>

#include "CsvExporter.hpp"
#include "ExportService.hpp"
#include "JsonExporter.hpp"
#include "JsonUtils.hpp"
#include "MarkdownExporter.hpp"
#include "TestHelpers.hpp"
#include "YamlExporter.hpp"

namespace {

Task makeTask(const QString &title, bool completed, std::optional<Priority> priority = std::nullopt) {
    Task task = Task::create(title, priority);
    if (completed) {
        task.complete();
    }
    return task;
}

std::vector<Task> sampleTasks() {
    return {makeTask(QStringLiteral("Shop"), false, Priority::High),
            makeTask(QStringLiteral("Pay bills"), true),
            makeTask(QStringLiteral("Call \"mom\", later"), false, Priority::Low)};
}

} // namespace

TEST(CsvExporterTest, HeaderPlusRows) {
    const std::vector<Task> tasks{makeTask(QStringLiteral("Shop"), false),
                                  makeTask(QStringLiteral("Pay bills"), true)};

    EXPECT_EQ(CsvExporter().render(tasks),
              QByteArray("title,completed,priority\nShop,false,\nPay bills,true,\n"));
}

TEST(CsvExporterTest, EmptyStoreIsHeaderOnly) {
    EXPECT_EQ(CsvExporter().render({}), QByteArray("title,completed,priority\n"));
}

TEST(CsvExporterTest, QuotesDelimiterAndQuotes) {
    const std::vector<Task> tasks{
        makeTask(QStringLiteral("Call \"mom\", later"), false, Priority::Low),
        makeTask(QStringLiteral("two\nlines"), true, Priority::Medium)};

    EXPECT_EQ(CsvExporter().render(tasks),
              QByteArray("title,completed,priority\n"
                         "\"Call \"\"mom\"\", later\",false,Low\n"
                         "\"two\nlines\",true,Medium\n"));
}

TEST(JsonExporterTest, MatchesPersistedShape) {
    const std::vector<Task> tasks = sampleTasks();
    const QByteArray bytes = JsonExporter().render(tasks);

    EXPECT_EQ(bytes, toJsonBytes(tasks));

    const auto parsed = parseTaskArray(bytes);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tasks);
}

TEST(JsonExporterTest, EmptyStoreIsEmptyArray) {
    const auto parsed = parseTaskArray(JsonExporter().render({}));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->empty());
}

TEST(YamlExporterTest, SequenceOfMappings) {
    EXPECT_EQ(YamlExporter().render(sampleTasks()),
              QByteArray("- title: \"Shop\"\n"
                         "  completed: false\n"
                         "  priority: High\n"
                         "- title: \"Pay bills\"\n"
                         "  completed: true\n"
                         "  priority: null\n"
                         "- title: \"Call \\\"mom\\\", later\"\n"
                         "  completed: false\n"
                         "  priority: Low\n"));
}

TEST(YamlExporterTest, EmptyStoreIsEmptySequence) {
    EXPECT_EQ(YamlExporter().render({}), QByteArray("[]\n"));
}

TEST(YamlExporterTest, EscapesControlCharacters) {
    const std::vector<Task> tasks{
        makeTask(QStringLiteral("a\\b\nc\td") + QChar(0x01) + QStringLiteral(": #x"), false)};

    EXPECT_EQ(YamlExporter().render(tasks),
              QByteArray("- title: \"a\\\\b\\nc\\td\\x01: #x\"\n"
                         "  completed: false\n"
                         "  priority: null\n"));
}

TEST(YamlExporterTest, EscapesNonPrintableUnicode) {
    QString title = QStringLiteral("c1");
    title += QChar(0x90);
    title += QStringLiteral(" nc");
    title += QChar(0xFFFE);
    title += QStringLiteral(" lone");
    title += QChar(0xD800);
    title += QStringLiteral(" ok é ");
    title += QString::fromUcs4(U"\U0001F600");
    const std::vector<Task> tasks{makeTask(title, false)};

    EXPECT_EQ(YamlExporter().render(tasks),
              QByteArray("- title: \"c1\\x90 nc\\ufffe lone\\ud800 ok \xC3\xA9 \xF0\x9F\x98\x80\"\n"
                         "  completed: false\n"
                         "  priority: null\n"));
}

TEST(MarkdownExporterTest, Checklist) {
    EXPECT_EQ(MarkdownExporter().render(sampleTasks()),
              QByteArray("- [ ] Shop (High)\n"
                         "- [x] Pay bills\n"
                         "- [ ] Call \"mom\", later (Low)\n"));
}

TEST(MarkdownExporterTest, LineBreaksBecomeSpaces) {
    const std::vector<Task> tasks{makeTask(QStringLiteral("one\r\ntwo\nthree"), true, Priority::Medium)};
    EXPECT_EQ(MarkdownExporter().render(tasks), QByteArray("- [x] one two three (Medium)\n"));
}

TEST(MarkdownExporterTest, EmptyStoreIsEmpty) {
    EXPECT_TRUE(MarkdownExporter().render({}).isEmpty());
}

TEST(ExportServiceTest, RenderingIsDeterministic) {
    const std::vector<Task> tasks = sampleTasks();
    for (ExportFormat format : {ExportFormat::Json, ExportFormat::Csv, ExportFormat::Yaml,
                                ExportFormat::Markdown}) {
        const auto first = makeExporter(format)->render(tasks);
        const auto second = makeExporter(format)->render(tasks);
        EXPECT_EQ(first, second) << formatName(format).toStdString();
    }
}

TEST(ExportServiceTest, FactoryMatchesFormat) {
    for (ExportFormat format : {ExportFormat::Json, ExportFormat::Csv, ExportFormat::Yaml,
                                ExportFormat::Markdown}) {
        EXPECT_EQ(makeExporter(format)->format(), format);
    }
    EXPECT_EQ(makeExporter(ExportFormat::Markdown)->fileExtension(), QStringLiteral("md"));
    EXPECT_EQ(makeExporter(ExportFormat::Yaml)->fileExtension(), QStringLiteral("yaml"));
}

TEST(ExportServiceTest, ParsesFormatTags) {
    EXPECT_EQ(parseExportFormat(QStringLiteral("json")), ExportFormat::Json);
    EXPECT_EQ(parseExportFormat(QStringLiteral("CSV")), ExportFormat::Csv);
    EXPECT_EQ(parseExportFormat(QStringLiteral("yml")), ExportFormat::Yaml);
    EXPECT_EQ(parseExportFormat(QStringLiteral("Markdown")), ExportFormat::Markdown);
    EXPECT_EQ(parseExportFormat(QStringLiteral("md")), ExportFormat::Markdown);

    EXPECT_TRUE(throwsTodoError([] { parseExportFormat(QStringLiteral("xml")); },
                                ErrorKind::ExportError));
    EXPECT_FALSE(exportFormatFromString(QString()).has_value());
}

TEST(ExportServiceTest, WritesDestination) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString destination = dir.filePath(QStringLiteral("out.csv"));
    const std::vector<Task> tasks = sampleTasks();

    exportTasks(tasks, destination, ExportFormat::Csv);
    EXPECT_EQ(readFile(destination), CsvExporter().render(tasks));

    // Second export overwrites, it does not append.
    exportTasks({}, destination, ExportFormat::Csv);
    EXPECT_EQ(readFile(destination), QByteArray("title,completed,priority\n"));
}

TEST(ExportServiceTest, UnwritableDestinationIsExportError) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString destination = dir.filePath(QStringLiteral("missing/out.md"));

    EXPECT_TRUE(throwsTodoError([&destination] {
        exportTasks(sampleTasks(), destination, ExportFormat::Markdown);
    }, ErrorKind::ExportError));
}
