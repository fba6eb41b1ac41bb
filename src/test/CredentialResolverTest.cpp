#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <unistd.h>
#include <vector>

#include "infrastructure/CredentialResolver.hpp"

using namespace localscribe::infrastructure;
namespace fs = std::filesystem;

namespace {

class CountingSource : public CredentialSource {
public:
    explicit CountingSource(int& counter) : m_counter(counter) {}
    std::optional<std::string> lookup() const override {
        ++m_counter;
        return std::string("from-file");
    }
    std::string describe() const override { return "counting source"; }

private:
    int& m_counter;
};

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CredentialResolver Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / ("localscribe_credentials_" + std::to_string(::getpid()));
    fs::create_directories(testRoot);
    const std::string first = (testRoot / "first.credentials").string();
    const std::string second = (testRoot / "second.credentials").string();

    // Environment wins and no further source is consulted.
    {
        ::setenv("HF_TOKEN", "env-token", 1);
        int fileReads = 0;
        std::vector<std::unique_ptr<CredentialSource>> sources;
        sources.push_back(std::make_unique<EnvironmentCredentialSource>("HF_TOKEN"));
        sources.push_back(std::make_unique<CountingSource>(fileReads));
        CredentialResolver resolver(std::move(sources));
        auto token = resolver.resolve();
        assert(token && *token == "env-token");
        assert(fileReads == 0);

        WriteFile(first, "HF_TOKEN=\"file-token\"\n");
        auto fromDefault = CredentialResolver::CreateDefault({first}).resolve();
        assert(fromDefault && *fromDefault == "env-token");
        std::cout << "[PASS] Environment variable takes precedence." << std::endl;
    }

    ::unsetenv("HF_TOKEN");

    // Quoted and unquoted forms yield the same value.
    {
        WriteFile(first, "HF_TOKEN=\"abc\"\n");
        auto quoted = CredentialResolver::CreateDefault({first}).resolve();
        assert(quoted && *quoted == "abc");

        WriteFile(first, "HF_TOKEN=abc\n");
        auto unquoted = CredentialResolver::CreateDefault({first}).resolve();
        assert(unquoted && *unquoted == "abc");
        std::cout << "[PASS] Quotes are stripped." << std::endl;
    }

    // Other keys, CRLF line endings and a key that merely shares the prefix.
    {
        WriteFile(first, "OTHER=1\r\nHF_TOKEN_OLD=nope\r\nHF_TOKEN=\"crlf\"\r\n");
        auto token = CredentialResolver::CreateDefault({first}).resolve();
        assert(token && *token == "crlf");
        std::cout << "[PASS] Only exact key lines match." << std::endl;
    }

    // An empty value is skipped in favor of the next candidate file.
    {
        WriteFile(first, "HF_TOKEN=\"\"\n");
        WriteFile(second, "HF_TOKEN=second-token\n");
        auto token = CredentialResolver::CreateDefault({first, second}).resolve();
        assert(token && *token == "second-token");
        std::cout << "[PASS] Empty value falls through to the next file." << std::endl;
    }

    // The first non-empty value stops the scan, even when later files also hold one.
    {
        WriteFile(first, "HF_TOKEN=first-token\n");
        WriteFile(second, "HF_TOKEN=second-token\n");
        auto token = CredentialResolver::CreateDefault({first, second}).resolve();
        assert(token && *token == "first-token");
        std::cout << "[PASS] First non-empty value wins." << std::endl;
    }

    // Nothing usable anywhere is a silent "not found".
    {
        WriteFile(first, "HF_TOKEN=\n");
        std::string missing = (testRoot / "does_not_exist").string();
        auto token = CredentialResolver::CreateDefault({first, missing}).resolve();
        assert(!token);

        ::setenv("HF_TOKEN", "", 1);
        assert(!CredentialResolver::CreateDefault({missing}).resolve());
        ::unsetenv("HF_TOKEN");
        std::cout << "[PASS] Missing credentials resolve to nothing." << std::endl;
    }

    assert(!CredentialResolver::ParseCredentialText("HF_TOKEN=\"\"\"\n", "HF_TOKEN"));

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
