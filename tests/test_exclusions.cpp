#include "exclusions.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

void testDefaults() {
    auto defaults = defaultExclusions();
    auto find = [&](const std::string& pattern) {
        return std::ranges::find(defaults, pattern, &ExclusionPattern::pattern);
    };
    assert(find(".git") != defaults.end() && find(".git")->enabled);
    assert(find("node_modules") != defaults.end() && find("node_modules")->enabled);
    assert(find("vendor") != defaults.end() && !find("vendor")->enabled);
    assert(find("*.sql.gz") != defaults.end() && !find("*.sql.gz")->enabled);
    assert(std::ranges::all_of(defaults, &ExclusionPattern::isAutomatic));
    std::cout << "✓ Default exclusions cover VCS, dependencies, logs and backups\n";
}

void testMatching() {
    ExclusionRules rules = ExclusionRules::withDefaults({});
    assert(rules.match("error_log"));
    assert(rules.match("logs/debug.log"));
    assert(rules.match("/.git/config"));
    assert(rules.match("app/node_modules/pkg/index.js"));
    assert(rules.match("wp-content/cache/page.html"));
    assert(rules.match("backup-2024.zip"));
    assert(!rules.match("index.php"));
    assert(!rules.match("vendor/autoload.php"));
    assert(!rules.match("dump.sql.gz"));
    assert(*rules.match("debug.log") == "Log files");
    std::cout << "✓ Component and path patterns match\n";
}

void testPathPatternsAnchorAtRoot() {
    ExclusionRules rules = ExclusionRules::withDefaults({});
    assert(rules.match("wp-content/updraft/x.zip") == "Backup archive");
    assert(!rules.match("site/wp-content/updraft/x.zip"));
    std::cout << "✓ Path patterns match relative prefixes\n";
}

void testCustomPatterns() {
    ExclusionRules rules = ExclusionRules::withDefaults({"uploads/private", "*.bak"});
    assert(rules.match("uploads/private/secret.pdf") == "User defined");
    assert(rules.match("config.php.bak") == "User defined");
    assert(!rules.match("uploads/public/a.png"));
    assert(rules.patterns().size() == defaultExclusions().size() + 2);
    assert(!rules.patterns().back().isAutomatic);
    std::cout << "✓ Custom patterns appended as user defined\n";
}

void testValidation() {
    assert(validateExclusionPatterns({"*.log", "cache/*"}));
    auto empty = validateExclusionPatterns({"  "});
    assert(!empty);
    assert(empty.error().kind == ErrorKind::ValidationError);
    assert(!validateExclusionPatterns({"bad\npattern"}));
    assert(!validateExclusionPatterns({"[abc"}));
    std::cout << "✓ Empty, control and unbalanced patterns rejected\n";
}

} // namespace

int main() {
    testDefaults();
    testMatching();
    testPathPatternsAnchorAtRoot();
    testCustomPatterns();
    testValidation();
    return 0;
}
