#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "../archive/archive.hpp"
#include "../archive/layout.hpp"
#include "../common.hpp"
#include "../records/records.hpp"
#include "../runtime/fileio.hpp"
#include "../runtime/zip.hpp"

using namespace farstore;

struct Args {
  std::string command;            // ls | show | repack
  std::vector<std::string> paths;
  bool compress = false;
  int level = -1;
};

static void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <command> [options]\n"
            << "  ls <archive>                      list entries\n"
            << "  show <archive>                    print decoded objects\n"
            << "  repack <in> <out> [--compress] [--level N]\n";
}

static Args parse(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string k = argv[i];
    auto need = [&](int n){ if (i + n >= argc) { std::cerr << "missing value for " << k << "\n"; std::exit(2); } };
    if (k == "--compress") { a.compress = true; }
    else if (k == "--level") { need(1); a.level = std::stoi(argv[++i]); a.compress = true; }
    else if (k == "-h" || k == "--help") { usage(argv[0]); std::exit(0); }
    else if (!k.empty() && k[0] == '-') { std::cerr << "Unknown arg: " << k << "\n"; usage(argv[0]); std::exit(2); }
    else if (a.command.empty()) { a.command = k; }
    else { a.paths.push_back(k); }
  }
  const size_t want = a.command == "repack" ? 2 : 1;
  if ((a.command != "ls" && a.command != "show" && a.command != "repack") || a.paths.size() != want) {
    usage(argv[0]);
    std::exit(2);
  }
  return a;
}

static std::string summary(const Registry& registry, const Value& v) {
  if (const CompositeKind* kind = registry.match(v)) return composite_tag(kind->tag);
  if (const NdArray* a = v.get_if<NdArray>()) return std::string(dtype_name(a->dtype)) + " " + a->shape.str();
  if (const Generic* g = v.get_if<Generic>()) return std::string(kind_name(g->kind)) + " " + repr(*g);
  return v.type_name();
}

static int cmd_ls(const std::string& path) {
  zip::ZipReader zip(slurp(with_far_extension(path)));
  for (const auto& e : zip.entries()) {
    std::cout << (e.method == zip::Method::Deflated ? "deflated " : "stored   ")
              << e.comp_size << "/" << e.uncomp_size << "\t" << e.name << "\n";
  }
  return 0;
}

static int cmd_show(const std::string& path) {
  Registry registry = make_default_registry();
  Collection objects = ArchiveReader(registry).read(path);
  for (const auto& kv : objects) {
    std::cout << kv.first << "\t" << to_string(registry.classify(kv.second)) << "\t"
              << summary(registry, kv.second) << "\n";
  }
  return 0;
}

static int cmd_repack(const Args& args) {
  Registry registry = make_default_registry();
  Collection objects = ArchiveReader(registry).read(args.paths[0]);
  WriteOptions options;
  options.compress = args.compress;
  options.level = args.level;
  std::string dest = ArchiveWriter(registry, options).write(args.paths[1], objects);
  std::cout << "[farstore] wrote " << objects.size() << " objects to '" << dest << "'"
            << (args.compress ? " (deflated)" : " (stored)") << "\n";
  return 0;
}

int main(int argc, char** argv) {
  try {
    Args args = parse(argc, argv);
    if (args.command == "ls") return cmd_ls(args.paths[0]);
    if (args.command == "show") return cmd_show(args.paths[0]);
    return cmd_repack(args);
  } catch (const farstore::Error& e) {
    std::cerr << "[error] " << to_string(e.kind()) << ": " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[error] " << e.what() << "\n";
    return 1;
  }
}
