#include "verifier/package/subtask.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <regex>

namespace verifier {
using namespace std;
namespace fs = std::filesystem;

static vector<fs::path> list_files_sorted(const fs::path &dir) {
    vector<fs::path> files;
    for (auto &entry : fs::recursive_directory_iterator(dir))
        if (entry.is_regular_file())
            files.push_back(entry.path());
    // 按文件名排序，文件名相同时按完整路径排序
    sort(files.begin(), files.end(), [](const fs::path &a, const fs::path &b) {
        if (a.filename() != b.filename()) return a.filename() < b.filename();
        return a < b;
    });
    return files;
}

subtask discover_subtask(const fs::path &tests_dir,
                         int id,
                         const string &regex,
                         int score,
                         const string &input_suffix,
                         const string &output_suffix,
                         vector<discovery_warning> &warnings) {
    subtask result;
    result.id = id;
    result.regex = regex;
    result.score = score;

    std::regex matcher(regex);
    string input_ext = "." + input_suffix;

    for (auto &path : list_files_sorted(tests_dir)) {
        string filename = path.filename().string();
        if (path.extension() != input_ext) continue;
        // 只要求从文件名开头匹配，不要求匹配整个文件名
        if (!regex_search(filename, matcher, regex_constants::match_continuous)) continue;

        test_case test;
        test.name = filename.substr(0, filename.size() - input_ext.size());
        test.input_path = path;
        if (path.parent_path() != tests_dir)
            test.relative_dir = path.parent_path().lexically_relative(tests_dir);
        test.output_path = path.parent_path() / (test.name + "." + output_suffix);
        test.subtask_id = id;

        if (!fs::is_regular_file(test.output_path)) {
            LOG(WARNING) << "Output not found for input " << path;
            warnings.push_back({id, path, "Output not found for input " + test.name});
            continue;
        }
        result.tests.push_back(move(test));
    }

    DLOG(INFO) << "Subtask " << id << " matched " << result.tests.size() << " tests with regex " << regex;
    return result;
}

}  // namespace verifier
