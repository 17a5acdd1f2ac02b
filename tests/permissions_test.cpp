#include <gtest/gtest.h>

#include "permsnap/permissions.hpp"

#include <sys/stat.h>

#include <string>

using namespace permsnap;

TEST(PermissionsTest, DirectoryWithGroupReadExecute) {
    EXPECT_EQ(permissions::symbolic(S_IFDIR | 0750), "drwxr-x---");
    EXPECT_EQ(permissions::octal(S_IFDIR | 0750), "750");
}

TEST(PermissionsTest, RegularFile) {
    EXPECT_EQ(permissions::symbolic(S_IFREG | 0644), "-rw-r--r--");
    EXPECT_EQ(permissions::octal(S_IFREG | 0644), "644");
}

TEST(PermissionsTest, TypeCharacters) {
    EXPECT_EQ(permissions::symbolic(S_IFLNK | 0777).front(), 'l');
    EXPECT_EQ(permissions::symbolic(S_IFBLK | 0660).front(), 'b');
    EXPECT_EQ(permissions::symbolic(S_IFCHR | 0666).front(), 'c');
    EXPECT_EQ(permissions::symbolic(S_IFIFO | 0600).front(), 'p');
    // Sockets have no symbol of their own and fall through to regular.
    EXPECT_EQ(permissions::symbolic(S_IFSOCK | 0755).front(), '-');
    EXPECT_EQ(permissions::symbolic(0644).front(), '-');
}

TEST(PermissionsTest, SetuidOverlay) {
    EXPECT_EQ(permissions::symbolic(S_IFREG | 04755), "-rwsr-xr-x");
    EXPECT_EQ(permissions::symbolic(S_IFREG | 04644), "-rwSr--r--");
}

TEST(PermissionsTest, SetgidOverlay) {
    EXPECT_EQ(permissions::symbolic(S_IFDIR | 02775), "drwxrwsr-x");
    EXPECT_EQ(permissions::symbolic(S_IFDIR | 02745), "drwxr-Sr-x");
}

TEST(PermissionsTest, StickyOverlay) {
    EXPECT_EQ(permissions::symbolic(S_IFDIR | 01777), "drwxrwxrwt");
    EXPECT_EQ(permissions::symbolic(S_IFDIR | 01776), "drwxrwxrwT");
}

TEST(PermissionsTest, OctalDropsSpecialBits) {
    EXPECT_EQ(permissions::octal(S_IFREG | 04755), "755");
    EXPECT_EQ(permissions::octal(S_IFDIR | 01777), "777");
    EXPECT_EQ(permissions::octal(S_IFREG), "000");
    EXPECT_EQ(permissions::octal(S_IFREG | 07), "007");
}

TEST(PermissionsTest, EveryBitCombinationHasFixedWidth) {
    const mode_t types[] = {S_IFREG, S_IFDIR, S_IFLNK, S_IFBLK, S_IFCHR, S_IFIFO, S_IFSOCK};
    for (mode_t type : types) {
        for (mode_t bits = 0; bits <= 07777; ++bits) {
            const mode_t mode = type | bits;
            const auto symbolic = permissions::symbolic(mode);
            const auto octal = permissions::octal(mode);
            ASSERT_EQ(symbolic.size(), 10u) << std::oct << mode;
            ASSERT_EQ(octal.size(), 3u) << std::oct << mode;
            for (char digit : octal) {
                ASSERT_TRUE(digit >= '0' && digit <= '7') << octal;
            }
            EXPECT_EQ(symbolic[1] == 'r', (bits & S_IRUSR) != 0);
            EXPECT_EQ(symbolic[5] == 'w', (bits & S_IWGRP) != 0);
            EXPECT_EQ(symbolic[9] == 't' || symbolic[9] == 'x', (bits & S_IXOTH) != 0);
        }
    }
}
