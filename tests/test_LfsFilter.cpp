// Catch includes
#include <catch2/catch_test_macros.hpp>

// Our includes
#include "LfsError.h"
#include "LfsFilter.h"
#include "TestUtilities.h"
#include "lfs/MockLfsTransport.h"

// Qt includes
#include <QDir>
#include <QTemporaryDir>

// Std includes
#include <memory>

using namespace QLfs;

namespace {

LfsClient mockClient(const std::shared_ptr<MockLfsTransport>& transport)
{
    return LfsClient(LfsClientConfig::Builder(MockLfsTransport::endpoint()).build(), transport);
}

}

TEST_CASE("LfsFilter cleans and smudges eligible files", "[LFS][filter]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    auto transport = std::make_shared<MockLfsTransport>();
    const LfsStore store = LfsStore::forGitDir(tempDir.path());
    const LfsFilter filter(mockClient(transport), store);

    const QByteArray content = TestUtilities::payload(10000, 'p');
    const LfsPointer pointer = LfsPointer::fromContent(content);

    auto cleanResult = filter.clean(QStringLiteral("images/photo.PNG"), content);
    INFO("Clean error:" << cleanResult.errorMessage().toStdString());
    REQUIRE(!cleanResult.hasError());
    CHECK(cleanResult.value() == pointer.toPointerText());
    CHECK(store.containsValid(pointer));
    CHECK(transport->object(pointer.oidHex()) == content);

    SECTION("Smudge is served from the local store") {
        const int requestsBefore = transport->requests().size();
        auto smudgeResult = filter.smudge(QStringLiteral("images/photo.PNG"), cleanResult.value());
        REQUIRE(!smudgeResult.hasError());
        CHECK(smudgeResult.value() == content);
        CHECK(transport->requests().size() == requestsBefore);
    }

    SECTION("Smudge falls back to the server and refills the store") {
        REQUIRE(!store.removeObject(pointer.oid()).hasError());

        auto smudgeResult = filter.smudge(QStringLiteral("images/photo.PNG"), cleanResult.value());
        INFO("Smudge error:" << smudgeResult.errorMessage().toStdString());
        REQUIRE(!smudgeResult.hasError());
        CHECK(smudgeResult.value() == content);
        CHECK(transport->getCount() == 1);
        CHECK(store.containsValid(pointer));
    }

    SECTION("A corrupted cache entry is downloaded again") {
        QByteArray corrupted = content;
        corrupted[0] = corrupted.at(0) == 'x' ? 'y' : 'x';
        REQUIRE(TestUtilities::writeFile(store.objectPath(pointer.oid()), corrupted));

        auto smudgeResult = filter.smudge(QStringLiteral("images/photo.PNG"), cleanResult.value());
        REQUIRE(!smudgeResult.hasError());
        CHECK(smudgeResult.value() == content);
        CHECK(transport->getCount() == 1);

        QByteArray repaired;
        CHECK(store.readVerified(pointer, &repaired));
    }
}

TEST_CASE("LfsFilter passes through content it does not handle", "[LFS][filter]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    auto transport = std::make_shared<MockLfsTransport>();
    const LfsFilter filter(mockClient(transport), LfsStore::forGitDir(tempDir.path()));

    SECTION("Ineligible paths are kept in git") {
        const QByteArray source("int main() { return 0; }\n");
        auto result = filter.clean(QStringLiteral("src/main.cpp"), source);
        REQUIRE(!result.hasError());
        CHECK(result.value() == source);

        auto noExtension = filter.clean(QStringLiteral("Makefile"), source);
        REQUIRE(!noExtension.hasError());
        CHECK(noExtension.value() == source);
    }

    SECTION("Small svg files without raster data are kept in git") {
        const QByteArray svg("<svg xmlns=\"http://www.w3.org/2000/svg\"><rect/></svg>");
        auto result = filter.clean(QStringLiteral("icon.svg"), svg);
        REQUIRE(!result.hasError());
        CHECK(result.value() == svg);
    }

    SECTION("Pointer text is not wrapped again") {
        const QByteArray pointerText = LfsPointer::fromContent(QByteArray("already converted")).toPointerText();
        auto result = filter.clean(QStringLiteral("photo.png"), pointerText);
        REQUIRE(!result.hasError());
        CHECK(result.value() == pointerText);
    }

    SECTION("Smudge leaves plain content alone") {
        const QByteArray plain("not a pointer at all");
        auto result = filter.smudge(QStringLiteral("photo.png"), plain);
        REQUIRE(!result.hasError());
        CHECK(result.value() == plain);
    }

    CHECK(transport->requests().isEmpty());
    CHECK(TestUtilities::countFilesRecursively(tempDir.path()) == 0);
}

TEST_CASE("LfsFilter reports missing objects on smudge", "[LFS][filter]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    auto transport = std::make_shared<MockLfsTransport>();
    const LfsFilter filter(mockClient(transport), LfsStore::forGitDir(tempDir.path()));

    const LfsPointer pointer = LfsPointer::fromContent(QByteArray("never uploaded"));
    auto result = filter.smudge(QStringLiteral("photo.png"), pointer.toPointerText());
    CHECK(result.hasError());
    CHECK(result.errorCode() == static_cast<int>(LfsErrorCode::NotFound));
}

TEST_CASE("LfsFilter cache write policy", "[LFS][filter]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    //A regular file where the objects directory should be makes every cache write fail
    const QString blocker = QDir(tempDir.path()).filePath(QStringLiteral("objects"));
    REQUIRE(TestUtilities::writeFile(blocker, QByteArray("not a directory")));
    const LfsStore store(blocker);

    auto transport = std::make_shared<MockLfsTransport>();
    const QByteArray content = TestUtilities::payload(512, 'w');
    const LfsPointer pointer = LfsPointer::fromContent(content);

    SECTION("Best effort keeps going") {
        const LfsFilter filter(mockClient(transport), store, LfsPolicy::trackAll());
        CHECK(filter.cacheWritePolicy() == LfsFilter::CacheWritePolicy::BestEffort);

        auto cleanResult = filter.clean(QStringLiteral("data.bin"), content);
        INFO("Clean error:" << cleanResult.errorMessage().toStdString());
        REQUIRE(!cleanResult.hasError());
        CHECK(cleanResult.value() == pointer.toPointerText());
        CHECK(transport->putCount() == 1);

        auto smudgeResult = filter.smudge(QStringLiteral("data.bin"), cleanResult.value());
        REQUIRE(!smudgeResult.hasError());
        CHECK(smudgeResult.value() == content);
        CHECK(transport->getCount() == 1);
    }

    SECTION("Required fails before uploading") {
        const LfsFilter filter(mockClient(transport), store, LfsPolicy::trackAll(),
                               LfsFilter::CacheWritePolicy::Required);

        auto cleanResult = filter.clean(QStringLiteral("data.bin"), content);
        CHECK(cleanResult.hasError());
        CHECK(cleanResult.errorCode() == static_cast<int>(LfsErrorCode::Io));
        CHECK(transport->requests().isEmpty());

        transport->addObject(content);
        auto smudgeResult = filter.smudge(QStringLiteral("data.bin"), pointer.toPointerText());
        CHECK(smudgeResult.hasError());
        CHECK(smudgeResult.errorCode() == static_cast<int>(LfsErrorCode::Io));
    }
}

TEST_CASE("LfsFilter surfaces upload failures from clean", "[LFS][filter]") {
    QTemporaryDir tempDir;
    REQUIRE(tempDir.isValid());

    auto transport = std::make_shared<MockLfsTransport>();
    transport->setBatchStatus(403, QByteArray("{\"message\":\"Write access denied\"}"));
    const LfsFilter filter(mockClient(transport), LfsStore::forGitDir(tempDir.path()), LfsPolicy::trackAll());

    auto result = filter.clean(QStringLiteral("data.bin"), QByteArray("denied"));
    CHECK(result.hasError());
    CHECK(result.errorCode() == static_cast<int>(LfsErrorCode::AuthRequired));
    CHECK(result.errorMessage().contains(QStringLiteral("Write access denied")));
}
