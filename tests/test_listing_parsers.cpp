#include "ftp_session.hpp"
#include "ssh_session.hpp"
#include <cassert>
#include <iostream>
#include <string>

namespace {

void testMlsd() {
    auto file = parseMlsdLine("type=file;size=1024;modify=20240501123000;unix.mode=0644; index.php\r\n");
    assert(file);
    assert(file->name == "index.php");
    assert(!file->isDir);
    assert(file->size == 1024);
    assert(file->mtime == 1714566600);
    assert(file->permissions == 0644);

    auto dir = parseMlsdLine("type=dir;modify=20240501123000; wp content");
    assert(dir && dir->isDir && dir->name == "wp content");

    auto link = parseMlsdLine("type=OS.unix=slink:/var/www/shared;size=12; current");
    assert(link && link->isSymlink);

    assert(!parseMlsdLine("type=cdir; ."));
    assert(!parseMlsdLine("type=pdir; .."));
    assert(!parseMlsdLine("size=10; untyped"));
    assert(!parseMlsdLine("garbage"));
    std::cout << "✓ MLSD lines parsed\n";
}

void testList() {
    auto file = parseListLine("-rw-r--r--    1 owner    group        2048 May 01 12:30 my file.txt");
    assert(file);
    assert(file->name == "my file.txt");
    assert(file->size == 2048);
    assert(file->permissions == 0644);
    assert(!file->isDir);

    auto dir = parseListLine("drwxr-xr-x    3 owner    group        4096 Jan 10  2023 uploads");
    assert(dir && dir->isDir && dir->permissions == 0755);

    auto link = parseListLine("lrwxrwxrwx    1 owner    group          11 Jan 10  2023 current -> releases/42");
    assert(link && link->isSymlink && link->name == "current");

    assert(!parseListLine("total 24"));
    assert(!parseListLine("drwxr-xr-x    2 owner    group        4096 Jan 10  2023 ."));
    assert(!parseListLine("short"));
    assert(!parseListLine("?rw-r--r--    1 owner    group        2048 May 01 12:30 odd"));
    std::cout << "✓ LIST lines parsed\n";
}

void testFeat() {
    std::string reply = "211-Features:\r\n MLSD\r\n SIZE\r\n UTF8\r\n211 End\r\n";
    auto features = parseFeatReply(reply);
    assert(features.size() == 3);
    assert(features[0] == "MLSD");
    assert(features[2] == "UTF8");
    std::cout << "✓ FEAT reply parsed\n";
}

void testFind() {
    auto file = parseFindLine("f\t512\t1714566600.5\t644\tREADME.md");
    assert(file);
    assert(!file->isDir && !file->isSymlink);
    assert(file->size == 512);
    assert(file->mtime == 1714566600);
    assert(file->permissions == 0644);
    assert(file->name == "README.md");

    auto dir = parseFindLine("d\t4096\t1714566600.0\t755\tassets");
    assert(dir && dir->isDir);
    auto link = parseFindLine("l\t9\t1714566600.0\t777\tlatest");
    assert(link && link->isSymlink);

    assert(!parseFindLine("f\t512\tREADME.md"));
    assert(!parseFindLine("f\tsize\t0\t644\tname"));
    std::cout << "✓ find -printf lines parsed\n";
}

} // namespace

int main() {
    testMlsd();
    testList();
    testFeat();
    testFind();
    return 0;
}
