#include <QTest>
#include <QObject>
#include <QPair>
#include "plaintextparser.h"

using ScriptFormat::Role;

class PlainTextParserTests : public QObject {
    Q_OBJECT

private:
    ScriptLine line(Role role, const QString &text) {
        ScriptLine l;
        l.id = ScriptDocument::createLineId();
        l.role = role;
        l.text = text;
        return l;
    }

    void compareLines(const QVector<ScriptLine> &actual, const QVector<QPair<Role, QString>> &expected) {
        QCOMPARE(actual.size(), expected.size());
        for (int i = 0; i < expected.size(); ++i) {
            QVERIFY2(actual.at(i).role == expected.at(i).first,
                     QString("Role mismatch at line %1 (%2)").arg(i).arg(actual.at(i).text).toUtf8().constData());
            QCOMPARE(actual.at(i).text, expected.at(i).second);
        }
    }

private slots:
    void recognizesScreenplayBlocks() {
        const QString text =
            "INT. DINER - NIGHT\n"
            "\n"
            "Rain streaks the window.\n"
            "A neon sign buzzes.\n"
            "\n"
            "MAYA\n"
            "(quietly)\n"
            "Coffee and pie,\n"
            "please.\n"
            "\n"
            "LEO (V.O.)\n"
            "No.\n"
            "\n"
            "ACT TWO\n"
            "\n"
            "INT./EXT. CAR - DAY\n";

        compareLines(PlainTextParser::parse(text), {
            {ScriptFormat::Header, "INT. DINER - NIGHT"},
            {ScriptFormat::Action, "Rain streaks the window. A neon sign buzzes."},
            {ScriptFormat::Speaker, "MAYA"},
            {ScriptFormat::Directions, "(quietly)"},
            {ScriptFormat::Dialog, "Coffee and pie, please."},
            {ScriptFormat::Speaker, "LEO (V.O.)"},
            {ScriptFormat::Dialog, "No."},
            {ScriptFormat::ChapterBreak, "ACT TWO"},
            {ScriptFormat::Header, "INT./EXT. CAR - DAY"},
        });
    }

    void capitalsWithoutDialogStayAction() {
        const QString text =
            "BANG!\n"
            "\n"
            "CUT TO:\n"
            "EXT. ROOF\n"
            "\n"
            "int. kitchen - day\n"
            "\n"
            "He turns.\n"
            "MAYA\n"
            "  Hi   there.  \n";

        compareLines(PlainTextParser::parse(text), {
            {ScriptFormat::Action, "BANG!"},
            {ScriptFormat::Action, "CUT TO:"},
            {ScriptFormat::Header, "EXT. ROOF"},
            {ScriptFormat::Action, "int. kitchen - day"},
            {ScriptFormat::Action, "He turns. MAYA Hi there."},
        });
    }

    void blankLineEndsDialog() {
        const QString text = "MAYA\r\nHello.\r\n\r\nShe leaves.\r\n(beat)\r\n";

        compareLines(PlainTextParser::parse(text), {
            {ScriptFormat::Speaker, "MAYA"},
            {ScriptFormat::Dialog, "Hello."},
            {ScriptFormat::Action, "She leaves."},
            {ScriptFormat::Directions, "(beat)"},
        });
        QVERIFY(PlainTextParser::parse("\n  \n").isEmpty());
    }

    void exportedTextReadsBack() {
        const QVector<ScriptLine> lines = {
            line(ScriptFormat::Header, "INT. DINER - NIGHT"),
            line(ScriptFormat::Action, "Rain falls."),
            line(ScriptFormat::Speaker, "MAYA"),
            line(ScriptFormat::Directions, "(quietly)"),
            line(ScriptFormat::Dialog, "Coffee, please."),
            line(ScriptFormat::ChapterBreak, "ACT TWO"),
            line(ScriptFormat::Header, "EXT. PIER - DAY"),
        };

        const QString text = PlainTextParser::toPlainText(lines);
        QCOMPARE(text, QString("INT. DINER - NIGHT\n\nRain falls.\n\nMAYA\n(quietly)\nCoffee, please.\n\n"
                               "ACT TWO\n\nEXT. PIER - DAY\n"));

        const QVector<ScriptLine> parsed = PlainTextParser::parse(text);
        QCOMPARE(parsed.size(), lines.size());
        for (int i = 0; i < lines.size(); ++i) {
            QCOMPARE(parsed.at(i).role, lines.at(i).role);
            QCOMPARE(parsed.at(i).text, lines.at(i).text);
        }
    }

    void exportNormalizesChaptersAndDirections() {
        const QVector<ScriptLine> lines = {
            line(ScriptFormat::Header, "int. hall"),
            line(ScriptFormat::Speaker, "Tom"),
            line(ScriptFormat::Directions, "softly"),
            line(ScriptFormat::Dialog, "Go."),
            line(ScriptFormat::ChapterBreak, "Finale"),
            line(ScriptFormat::ChapterBreak, ""),
        };

        QCOMPARE(PlainTextParser::toPlainText(lines),
                 QString("INT. HALL\n\nTOM\n(softly)\nGo.\n\nCHAPTER FINALE\n\nCHAPTER\n"));
    }
};

QTEST_GUILESS_MAIN(PlainTextParserTests)
#include "plaintextparser_test.moc"
