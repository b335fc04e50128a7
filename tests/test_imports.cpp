#include <catch2/catch.hpp>
#include <sift/imports.hpp>

using namespace sift;

using Paths = std::vector<std::string>;

TEST_CASE("Python import specifiers", "[imports]") {
    auto specs = import_specifiers("app/main.py",
        "import os, app.util as u\n"
        "from . import helpers\n"
        "from ..core.models import User, Group  # comment\n"
        "from pkg import *\n");
    CHECK(specs == Paths{"os", "app.util", ".", ".helpers", "..core.models",
                         "..core.models.User", "..core.models.Group", "pkg"});
}

TEST_CASE("JS, include, Rust and Java specifiers", "[imports]") {
    CHECK(import_specifiers("web/app.ts",
        "import { a } from './a';\nimport './side';\nconst b = require(\"../b\");\n")
        == Paths{"./a", "./side", "../b"});
    CHECK(import_specifiers("src/net.cpp",
        "#include <vector>\n#include \"net/socket.h\"\n")
        == Paths{"net/socket.h"});
    CHECK(import_specifiers("src/lib.rs", "pub mod parser;\nmod util;\nuse std::io;\n")
        == Paths{"parser", "util"});
    CHECK(import_specifiers("A.java",
        "import com.acme.Widget;\nimport com.acme.util.*;\n")
        == Paths{"com.acme.Widget"});
    CHECK(import_specifiers("README.md", "import foo\n").empty());
}

TEST_CASE("Python imports resolve absolute, relative and by suffix", "[imports]") {
    ImportResolver r({"app/__init__.py", "app/main.py", "app/util.py",
                      "app/core/models.py", "app/helpers/__init__.py",
                      "lib/src/shared/io.py"});

    CHECK(r.resolve("app/main.py",
        "import app.util\nfrom . import helpers\nfrom .core import models\n")
        == Paths{"app/__init__.py", "app/core/models.py", "app/helpers/__init__.py",
                 "app/util.py"});
    CHECK(r.resolve("app/core/models.py", "from ..util import thing\n")
        == Paths{"app/util.py"});
    CHECK(r.resolve("app/main.py", "import shared.io\n") == Paths{"lib/src/shared/io.py"});
    CHECK(r.resolve("app/main.py", "import requests\n").empty());
}

TEST_CASE("Relative JS imports try extensions and index files", "[imports]") {
    ImportResolver r({"web/app.ts", "web/util.ts", "web/comp/index.tsx", "lib/b.js"});
    CHECK(r.resolve("web/app.ts",
        "import u from './util';\nimport C from './comp';\nimport x from '../lib/b';\n"
        "import React from 'react';\n")
        == Paths{"lib/b.js", "web/comp/index.tsx", "web/util.ts"});
}

TEST_CASE("Imports never point at the importing file or outside the root", "[imports]") {
    ImportResolver r({"a.py", "web/x.js"});
    CHECK(r.resolve("a.py", "import a\n").empty());
    CHECK(r.resolve("web/x.js", "import y from '../../etc/passwd';\n").empty());
}

TEST_CASE("Quoted includes resolve beside the file or by suffix", "[imports]") {
    ImportResolver r({"src/net/socket.cpp", "src/net/socket.h", "include/net/socket.h",
                      "src/util.h"});
    CHECK(r.resolve("src/net/socket.cpp", "#include \"socket.h\"\n")
        == Paths{"src/net/socket.h"});
    CHECK(r.resolve("src/main.cpp", "#include \"util.h\"\n#include \"net/socket.h\"\n")
        == Paths{"include/net/socket.h", "src/util.h"});
}

TEST_CASE("Rust mod declarations and Java imports", "[imports]") {
    ImportResolver rs({"src/lib.rs", "src/parser.rs", "src/util/mod.rs",
                       "src/parser/lexer.rs"});
    CHECK(rs.resolve("src/lib.rs", "mod parser;\nmod util;\n")
        == Paths{"src/parser.rs", "src/util/mod.rs"});
    CHECK(rs.resolve("src/parser.rs", "mod lexer;\n") == Paths{"src/parser/lexer.rs"});

    ImportResolver jv({"src/main/java/com/acme/Widget.java",
                       "src/main/java/com/acme/App.java"});
    CHECK(jv.resolve("src/main/java/com/acme/App.java",
        "import com.acme.Widget;\nimport static com.acme.Widget.make;\n")
        == Paths{"src/main/java/com/acme/Widget.java"});
}

TEST_CASE("JS scanner handles compact and dynamic forms", "[imports]") {
    CHECK(import_specifiers("web/a.mjs",
        "import{a as b}from\"./x\";export * from './y';const m=await import('./lazy');\n")
        == Paths{"./x", "./y", "./lazy"});
    CHECK(import_specifiers("web/a.js",
        "import { from } from './named';\nobj.require('./no');\nrequire('./dyn' + n);\n"
        "export const s = 'from ./nope';\n")
        == Paths{"./named"});
}

TEST_CASE("A 100KB single-line bundle is scanned without blowing up", "[imports]") {
    std::string bundle = "import{a as b}from\"./x\";export default function(){";
    while (bundle.size() < 100 * 1024) bundle += "var q=b(1)+b(2),r=q*3;";
    bundle += "};require(\"./tail\");";

    CHECK(import_specifiers("dist/bundle.min.js", bundle) == Paths{"./x", "./tail"});

    ImportResolver r({"dist/bundle.min.js", "dist/x.js", "dist/tail.js"});
    CHECK(r.resolve("dist/bundle.min.js", bundle) == Paths{"dist/tail.js", "dist/x.js"});
}

TEST_CASE("Overlong lines are skipped by line-based languages", "[imports]") {
    std::string line(8 * 1024, ' ');
    line += "#include \"far.h\"";
    CHECK(import_specifiers("gen/table.c", line + "\n#include \"near.h\"\n")
        == Paths{"near.h"});
}
