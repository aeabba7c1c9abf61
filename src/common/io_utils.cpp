#include "verifier/common/io_utils.hpp"
#include <errno.h>
#include <unistd.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path, ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to read file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout << content;
}

bool normalize_line_endings(const fs::path &path) {
    string content = read_file_content(path);
    string normalized;
    normalized.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] != '\r') {
            normalized.push_back(content[i]);
            continue;
        }
        // \r\n 和单独的 \r 都视为一个换行
        normalized.push_back('\n');
        if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
    }
    if (normalized == content) return false;
    write_file_content(path, normalized);
    return true;
}

string assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    bool safe = !subpath.empty() && !path.has_root_path();
    for (auto &part : path)
        if (part == "..") safe = false;
    if (!safe)
        throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

bool is_executable(const fs::path &path) {
    return fs::is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

}  // namespace verifier
