/*
 * bashgate - shared test helpers
 */
#ifndef bashgate_TESTS_TEST_HELPERS_HPP
#define bashgate_TESTS_TEST_HELPERS_HPP

#include <bashgate/policy/policy.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>
#include <string>
#include <ftw.h>
#include <unistd.h>

namespace bashgate {
namespace testing_support {

// mkdtemp() directory removed with everything in it on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/bashgate_test_XXXXXX";
        char* made = mkdtemp(tmpl);
        path_ = made ? made : "";
    }

    ~TempDir() {
        if (!path_.empty()) {
            nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) const { return path_ + "/" + name; }

    std::string write(const std::string& name, const std::string& content) const {
        std::string p = file(name);
        std::ofstream out(p.c_str(), std::ios::out | std::ios::trunc | std::ios::binary);
        out << content;
        return p;
    }

private:
    TempDir(const TempDir&);
    TempDir& operator=(const TempDir&);

    static int remove_entry(const char* p, const struct stat*, int, struct FTW*) {
        return ::remove(p);
    }

    std::string path_;
};

inline PolicySnapshot make_policy(const std::set<std::string>& commands,
                                  const std::set<std::string>& directories,
                                  bool strict = true,
                                  size_t max_output = PolicySnapshot::DEFAULT_MAX_OUTPUT_SIZE) {
    return PolicySnapshot(commands, directories, strict, max_output);
}

} // namespace testing_support
} // namespace bashgate

#endif // bashgate_TESTS_TEST_HELPERS_HPP
