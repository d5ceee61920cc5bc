#include <QtTest/QtTest>
#include "../src/core/common/Expected.hpp"

using namespace Evalbox;

namespace {

enum class ParseError {
    Empty,
    NotANumber
};

Expected<int, ParseError> parseNumber(const QString& text) {
    if (text.isEmpty()) {
        return makeUnexpected(ParseError::Empty);
    }
    bool ok = false;
    const int number = text.toInt(&ok);
    if (!ok) {
        return makeUnexpected(ParseError::NotANumber);
    }
    return number;
}

} // namespace

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QCOMPARE(result.value(), 42);
        QCOMPARE(*result, 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QVERIFY(!result);
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testSameValueAndErrorType() {
        // only makeUnexpected selects the error alternative
        Expected<QString, QString> value(QString("payload"));
        QVERIFY(value.hasValue());
        QCOMPARE(value.value(), QString("payload"));

        Expected<QString, QString> error = makeUnexpected(QString("payload"));
        QVERIFY(error.hasError());
        QCOMPARE(error.error(), QString("payload"));
    }

    void testWrongAccessThrows() {
        Expected<int, ParseError> failure = parseNumber("abc");
        QVERIFY_THROWS_EXCEPTION(std::logic_error, failure.value());

        Expected<int, ParseError> success = parseNumber("7");
        QVERIFY_THROWS_EXCEPTION(std::logic_error, success.error());
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testMapError() {
        auto lifted = parseNumber("").mapError([](ParseError e) {
            return e == ParseError::Empty ? QString("empty") : QString("nan");
        });
        QVERIFY(lifted.hasError());
        QCOMPARE(lifted.error(), QString("empty"));

        auto untouched = parseNumber("12").mapError([](ParseError) { return QString("unused"); });
        QVERIFY(untouched.hasValue());
        QCOMPARE(untouched.value(), 12);
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testVoidSpecialization() {
        Expected<void, ParseError> ok;
        QVERIFY(ok.hasValue());
        ok.value();

        Expected<void, ParseError> failed = makeUnexpected(ParseError::NotANumber);
        QVERIFY(failed.hasError());
        QVERIFY(failed.error() == ParseError::NotANumber);
        QVERIFY_THROWS_EXCEPTION(std::logic_error, failed.value());
    }

    void testMemberAccess() {
        Expected<QString, ParseError> text(QString("sandbox"));
        QCOMPARE(text->size(), 7);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
