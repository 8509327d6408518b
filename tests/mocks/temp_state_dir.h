#pragma once
/**
 * Scratch directory removed at the end of a test.
 */

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {
namespace testing {

class TempStateDir {
public:
    TempStateDir() {
        std::vector<char> pattern;
        const std::string base = "/tmp/sendspin-test-XXXXXX";
        pattern.assign(base.begin(), base.end());
        pattern.push_back('\0');
        if (!mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern.data();
    }

    ~TempStateDir() { remove_tree(path_); }

    TempStateDir(const TempStateDir&) = delete;
    TempStateDir& operator=(const TempStateDir&) = delete;

    const std::string& path() const { return path_; }

private:
    static void remove_tree(const std::string& path) {
        if (DIR* dir = opendir(path.c_str())) {
            while (struct dirent* entry = readdir(dir)) {
                const std::string name = entry->d_name;
                if (name == "." || name == "..") {
                    continue;
                }
                const std::string child = path + "/" + name;
                struct stat st {};
                if (lstat(child.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                    remove_tree(child);
                } else {
                    unlink(child.c_str());
                }
            }
            closedir(dir);
        }
        rmdir(path.c_str());
    }

    std::string path_;
};

} // namespace testing
} // namespace audio
} // namespace sendspin
