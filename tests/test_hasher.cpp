#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include "stlmeta/Hasher.hpp"
#include "stlmeta/Surface.hpp"

using stlmeta::Hasher;

int main() {
  // Known SHA-256 vectors
  {
    if (Hasher::sha256("") != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
      std::cerr << "empty hash: " << Hasher::sha256("") << "\n";
      return 1;
    }
    if (Hasher::sha256("abc") != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
      std::cerr << "abc hash: " << Hasher::sha256("abc") << "\n";
      return 1;
    }
  }

  // Chunked updates give the same digest as one update
  {
    Hasher h;
    h.update("abcdbcdecdefdefgefgh");
    h.update("");
    h.update("fghighijhijkijkljklmklmnlmnomnopnopq");
    std::string chunked = h.hexdigest();
    if (chunked != "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1") {
      std::cerr << "chunked hash: " << chunked << "\n";
      return 1;
    }
  }

  // Surface::load feeds the digest with the file's bytes, CRLF included
  {
    auto path = std::filesystem::temp_directory_path() / "stlmeta_hash_load.stl";
    const std::string text = "solid s\r\nendsolid s\r\n";
    { std::ofstream out(path, std::ios::binary); out << text; }

    stlmeta::Surface surface;
    Hasher digest;
    surface.load(path.string(), &digest);
    std::string loaded = digest.hexdigest();
    std::filesystem::remove(path);

    if (loaded != Hasher::sha256(text) || !surface.name() || *surface.name() != "s") {
      std::cerr << "load digest: " << loaded << "\n";
      return 1;
    }
  }

  // Empty file hashes to the empty digest
  {
    auto path = std::filesystem::temp_directory_path() / "stlmeta_hash_empty.stl";
    { std::ofstream out(path, std::ios::binary); }

    stlmeta::Surface surface;
    Hasher digest;
    surface.load(path.string(), &digest);
    std::string loaded = digest.hexdigest();
    std::filesystem::remove(path);

    if (loaded != "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855") {
      std::cerr << "empty load digest: " << loaded << "\n";
      return 1;
    }
  }

  // A digest cannot be finalized twice
  {
    Hasher h;
    h.update("abc");
    (void)h.hexdigest();
    bool threw = false;
    try {
      (void)h.hexdigest();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "second hexdigest did not throw\n";
      return 1;
    }
  }

  return 0;
}
