#pragma once

#include <cstdio>
#include <fstream>
#include <string>

#include <boost/filesystem.hpp>
#include <yaml-cpp/yaml.h>

/**
 * Inline YAML for configuration tests. Can be saved to a temporary
 * file, the file is removed with TestConfig.
 * */
class TestConfig {
    public:
        TestConfig(const std::string& strdata) : mData(strdata) {
            mYAML = YAML::Load(strdata);
        }

        ~TestConfig() {
            if (!mPath.empty())
                boost::filesystem::remove(mPath);
        }

        const std::string& saveToFile() {
            if (mPath.empty()) {
                mPath = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("mypv-%%%%-%%%%.yaml")).native();
                std::ofstream out(mPath);
                out << mData;
            }
            return mPath;
        }

    YAML::Node mYAML;
    private:
        std::string mData;
        std::string mPath;
};
