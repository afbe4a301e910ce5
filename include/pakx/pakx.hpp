#pragma once

// PAK Archive Library
// A C++20 library for reading, writing and editing the .pak archive format
// used by Quake, Half-Life and other id Tech / GoldSrc engine games.

#include "archive.hpp"
#include "reader.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides two levels of abstraction:
//
// 1. Low-level: decode() / encode()
//    - Pure transforms between a PAK image and a list of entries
//    - decodeFile() / encodeFile() do the same against files on disk
//
// 2. High-level: Archive class
//    - Owns the entries and offers add/remove/lookup/extract
//    - Use Archive::open() to load, Archive::create() to start empty
//
// Example usage:
//
//   // Reading an archive
//   pakx::Error error;
//   auto archive = pakx::Archive::open("pak0.pak", &error);
//   if (archive) {
//     for (const auto& file : archive->files()) {
//       std::cout << file.name << std::endl;
//     }
//     if (const auto* entry = archive->findFile("maps/e1m1.bsp")) {
//       archive->extract(*entry, "out", pakx::ExtractMode::Nested);
//     }
//   }
//
//   // Creating a new archive
//   auto archive = pakx::Archive::create();
//   archive.addFile(std::filesystem::path("e1m1.bsp"), "maps/e1m1.bsp");
//   archive.write("pak1.pak");

namespace pakx {}
