#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>
#include "../../../../src/keeper/exec/helper/file_system.h"

namespace keeper
{
    namespace exec
    {
        namespace helper
        {
            TEST(FileSystemTest, JoinPath)
            {
                EXPECT_EQ("/opt/keeper", JoinPath("/opt", "keeper"));
                EXPECT_EQ("/opt/keeper", JoinPath("/opt/", "keeper"));
                EXPECT_EQ("/opt/keeper", JoinPath("/opt/", "/keeper"));
                EXPECT_EQ("keeper", JoinPath("", "keeper"));
            }

            TEST(FileSystemTest, MakeAbsolutePath)
            {
                EXPECT_EQ("/home/user/AutoQC.exe", MakeAbsolutePath("AutoQC.exe", "/home/user"));
                EXPECT_EQ("/home/user/../bin/AutoQC.exe", MakeAbsolutePath("../bin/AutoQC.exe", "/home/user"));
                EXPECT_EQ("/opt/AutoQC.exe", MakeAbsolutePath("/opt/AutoQC.exe", "/home/user"));
                EXPECT_EQ("", MakeAbsolutePath("", "/home/user"));
            }

            TEST(FileSystemTest, PathComponents)
            {
                const std::string cPath{"/home/user/AutoQC/AutoQC-daily.exe"};

                EXPECT_EQ("AutoQC-daily.exe", BaseName(cPath));
                EXPECT_EQ("/home/user/AutoQC", DirName(cPath));
                EXPECT_EQ("AutoQC-daily", FileStem(cPath));
                EXPECT_EQ("AutoQC", FileStem("AutoQC"));
                EXPECT_EQ("/", DirName("/keeper"));
                EXPECT_EQ("", DirName("keeper"));
            }

            TEST(FileSystemTest, ToLower)
            {
                EXPECT_EQ("daily", ToLower("DaIlY"));
            }

            TEST(FileSystemTest, ExistenceChecks)
            {
                const std::string cDirectory{"/tmp/keeper_file_system_test"};
                const std::string cFile{cDirectory + "/target.exe"};
                ::mkdir(cDirectory.c_str(), 0755);
                {
                    std::ofstream _stream(cFile);
                    _stream << "binary";
                }

                EXPECT_TRUE(FileExists(cFile));
                EXPECT_FALSE(FileExists(cDirectory));
                EXPECT_TRUE(DirectoryExists(cDirectory));
                EXPECT_FALSE(DirectoryExists(cFile));
                EXPECT_FALSE(FileExists(""));

                std::remove(cFile.c_str());
                ::rmdir(cDirectory.c_str());
                EXPECT_FALSE(FileExists(cFile));
            }

            TEST(FileSystemTest, ExecutablePath)
            {
                const auto cResult{GetExecutablePath()};
                ASSERT_TRUE(cResult.HasValue());
                EXPECT_TRUE(FileExists(cResult.Value()));
            }

            TEST(FileSystemTest, WorkingDirectory)
            {
                const auto cOriginal{GetWorkingDirectory()};
                ASSERT_TRUE(cOriginal.HasValue());

                ASSERT_TRUE(SetWorkingDirectory("/tmp").HasValue());
                const auto cChanged{GetWorkingDirectory()};
                ASSERT_TRUE(cChanged.HasValue());
                EXPECT_EQ("/tmp", cChanged.Value());

                EXPECT_FALSE(SetWorkingDirectory("/nonexistent_keeper_directory").HasValue());
                ASSERT_TRUE(SetWorkingDirectory(cOriginal.Value()).HasValue());
            }
        }
    }
}
