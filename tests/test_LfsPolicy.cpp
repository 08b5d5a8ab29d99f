// Catch includes
#include <catch2/catch_test_macros.hpp>

// Our includes
#include "LfsPolicy.h"
#include "TestUtilities.h"

// Qt includes
#include <QTemporaryDir>

using namespace QLfs;

TEST_CASE("LfsPolicy default rules", "[LFS][policy]") {
    const LfsPolicy policy = LfsPolicy::defaultPolicy();

    CHECK(policy.isEligible(QStringLiteral("photo.png")));
    CHECK(policy.isEligible(QStringLiteral("dir/Scan.JPG")));
    CHECK(policy.isEligible(QStringLiteral("model.glb")));
    CHECK_FALSE(policy.isEligible(QStringLiteral("notes.txt")));
    CHECK_FALSE(policy.isEligible(QStringLiteral("README")));
    CHECK_FALSE(policy.isEligible(QStringLiteral(".gitignore")));

    CHECK(policy.trackedExtensions().contains(QStringLiteral("png")));
    CHECK(policy.trackedExtensions().contains(QStringLiteral("svg")));
    CHECK_FALSE(policy.trackedExtensions().contains(QStringLiteral("txt")));
}

TEST_CASE("LfsPolicy svg rule", "[LFS][policy]") {
    const LfsPolicy policy = LfsPolicy::defaultPolicy();

    const QByteArray plain("<svg><rect width=\"1\" height=\"1\"/></svg>");
    const QByteArray embedded("<svg><image href=\"DATA:image/png;base64,AAAA\"/></svg>");
    QByteArray large("<svg>");
    large.append(QByteArray(300 * 1024, ' '));
    large.append("</svg>");

    SECTION("In memory") {
        CHECK_FALSE(policy.isEligible(QStringLiteral("icon.svg"), &plain));
        CHECK(policy.isEligible(QStringLiteral("icon.svg"), &embedded));
        CHECK(policy.isEligible(QStringLiteral("icon.svg"), &large));
    }

    SECTION("On disk") {
        QTemporaryDir tempDir;
        REQUIRE(tempDir.isValid());

        const QString plainPath = tempDir.filePath(QStringLiteral("plain.svg"));
        const QString embeddedPath = tempDir.filePath(QStringLiteral("embedded.svg"));
        const QString largePath = tempDir.filePath(QStringLiteral("large.svg"));
        REQUIRE(TestUtilities::writeFile(plainPath, plain));
        REQUIRE(TestUtilities::writeFile(embeddedPath, embedded));
        REQUIRE(TestUtilities::writeFile(largePath, large));

        CHECK_FALSE(policy.isEligible(plainPath));
        CHECK(policy.isEligible(embeddedPath));
        CHECK(policy.isEligible(largePath));
        CHECK_FALSE(policy.isEligible(tempDir.filePath(QStringLiteral("missing.svg"))));
    }
}

TEST_CASE("LfsPolicy custom rules", "[LFS][policy]") {
    LfsPolicy policy;
    CHECK_FALSE(policy.isEligible(QStringLiteral("anything.bin")));

    policy.setRule(QStringLiteral("BIN"), [](const QString&, const QByteArray* data) {
        return data && data->size() > 4;
    });
    const QByteArray small("1234");
    const QByteArray big("12345");
    CHECK_FALSE(policy.isEligible(QStringLiteral("a.bin"), &small));
    CHECK(policy.isEligible(QStringLiteral("a.bin"), &big));
    CHECK(policy.trackedExtensions() == QStringList{QStringLiteral("bin")});

    policy.setRule(QString(), [](const QString&, const QByteArray*) { return true; });
    CHECK(policy.trackedExtensions().size() == 1);

    policy.setDefaultRule([](const QString& path, const QByteArray*) {
        return path.startsWith(QStringLiteral("assets/"));
    });
    CHECK(policy.isEligible(QStringLiteral("assets/blob")));
    CHECK_FALSE(policy.isEligible(QStringLiteral("src/blob")));

    CHECK(LfsPolicy::trackAll().isEligible(QStringLiteral("Makefile")));
    CHECK(LfsPolicy::trackAll().trackedExtensions().isEmpty());
}
