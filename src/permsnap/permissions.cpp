#include "permsnap/permissions.hpp"

#include <fmt/format.h>
#include <sys/stat.h>

#include <array>
#include <vector>

namespace permsnap::permissions {

namespace {

struct Rule {
    mode_t mask;
    char symbol;
};

// One slot per output character. Within a slot the first rule whose mask is fully
// set in the mode wins; a slot with no match renders '-'.
const std::array<std::vector<Rule>, 10>& symbol_table() {
    static const std::array<std::vector<Rule>, 10> table{{
        {{S_IFLNK, 'l'}, {S_IFREG, '-'}, {S_IFBLK, 'b'}, {S_IFDIR, 'd'}, {S_IFCHR, 'c'}, {S_IFIFO, 'p'}},

        {{S_IRUSR, 'r'}},
        {{S_IWUSR, 'w'}},
        {{S_IXUSR | S_ISUID, 's'}, {S_ISUID, 'S'}, {S_IXUSR, 'x'}},

        {{S_IRGRP, 'r'}},
        {{S_IWGRP, 'w'}},
        {{S_IXGRP | S_ISGID, 's'}, {S_ISGID, 'S'}, {S_IXGRP, 'x'}},

        {{S_IROTH, 'r'}},
        {{S_IWOTH, 'w'}},
        {{S_IXOTH | S_ISVTX, 't'}, {S_ISVTX, 'T'}, {S_IXOTH, 'x'}},
    }};
    return table;
}

} // namespace

std::string symbolic(mode_t mode) {
    std::string result;
    result.reserve(10);
    for (const auto& slot : symbol_table()) {
        char symbol = '-';
        for (const auto& rule : slot) {
            if ((mode & rule.mask) == rule.mask) {
                symbol = rule.symbol;
                break;
            }
        }
        result.push_back(symbol);
    }
    return result;
}

std::string octal(mode_t mode) {
    return fmt::format("{:03o}", static_cast<unsigned>(mode & 0777));
}

} // namespace permsnap::permissions
