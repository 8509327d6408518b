#include <gtest/gtest.h>
#include "service/client_identity.h"
#include "../mocks/temp_state_dir.h"

#include <sys/stat.h>

#include <fstream>
#include <regex>
#include <string>

using namespace sendspin::audio;
using sendspin::audio::testing::TempStateDir;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

bool is_uuid(const std::string& text) {
    static const std::regex pattern("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");
    return std::regex_match(text, pattern);
}

} // namespace

class ClientIdentityTest : public ::testing::Test {
protected:
    TempStateDir dir;
};

TEST_F(ClientIdentityTest, CreatesAndPersistsNewId) {
    auto identity = ClientIdentity::load_or_create(dir.path(), nullptr);

    EXPECT_TRUE(is_uuid(identity.id()));
    EXPECT_TRUE(identity.persisted());
    EXPECT_EQ(identity.path(), dir.path() + "/client_id");
    EXPECT_EQ(read_file(identity.path()), identity.id());
}

TEST_F(ClientIdentityTest, ReusesStoredId) {
    const std::string first = ClientIdentity::load_or_create(dir.path(), nullptr).id();
    const std::string second = ClientIdentity::load_or_create(dir.path(), nullptr).id();
    EXPECT_EQ(first, second);
}

TEST_F(ClientIdentityTest, AcceptsStoredIdWithWhitespaceAndBraces) {
    write_file(dir.path() + "/client_id", "  {6F1D2C3B-4A59-4E6F-8A7B-9C0D1E2F3A4B}\n\n");
    auto identity = ClientIdentity::load_or_create(dir.path(), nullptr);
    EXPECT_EQ(identity.id(), "6f1d2c3b-4a59-4e6f-8a7b-9c0d1e2f3a4b");
}

TEST_F(ClientIdentityTest, ReplacesMalformedId) {
    const std::string path = dir.path() + "/client_id";
    write_file(path, "not-a-uuid\n");

    auto identity = ClientIdentity::load_or_create(dir.path(), nullptr);
    EXPECT_TRUE(is_uuid(identity.id()));
    EXPECT_EQ(read_file(path), identity.id());
}

TEST_F(ClientIdentityTest, ReplacesNilId) {
    write_file(dir.path() + "/client_id", "00000000-0000-0000-0000-000000000000\n");
    auto identity = ClientIdentity::load_or_create(dir.path(), nullptr);
    EXPECT_NE(identity.id(), "00000000-0000-0000-0000-000000000000");
}

TEST_F(ClientIdentityTest, CreatesMissingStateDirectories) {
    const std::string nested = dir.path() + "/state/sendspin-player";
    auto identity = ClientIdentity::load_or_create(nested, nullptr);

    EXPECT_TRUE(identity.persisted());
    struct stat st {};
    ASSERT_EQ(stat(nested.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
}

TEST_F(ClientIdentityTest, UnwritableLocationStillYieldsId) {
    const std::string blocker = dir.path() + "/blocker";
    write_file(blocker, "file, not a directory");

    auto identity = ClientIdentity::load_or_create(blocker + "/state", nullptr);
    EXPECT_TRUE(is_uuid(identity.id()));
    EXPECT_FALSE(identity.persisted());
}
