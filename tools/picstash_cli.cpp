#include <picstash/image_service.hpp>
#include <picstash/object_store.hpp>
#include <picstash/rocks_registry.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " <db_path> <images_dir> upload <file>\n"
      << "  " << argv0 << " <db_path> <images_dir> source <id>\n"
      << "  " << argv0 << " <db_path> <images_dir> set-source <id> <url>\n"
      << "  " << argv0 << " <db_path> <images_dir> delete <id>\n"
      << "  " << argv0 << " <db_path> <images_dir> count\n"
      << "  " << argv0 << " <db_path> <images_dir> sweep [grace_s]\n";
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

int main(int argc, char** argv) {
  if (argc < 4) { usage(argv[0]); return 2; }

  std::string db_path = argv[1];
  std::string images_dir = argv[2];
  std::string cmd = argv[3];

  std::unique_ptr<picstash::RocksRegistry> registry;
  auto s = picstash::RocksRegistry::Open(db_path, &registry);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::unique_ptr<picstash::FileObjectStore> objects;
  try {
    objects = std::make_unique<picstash::FileObjectStore>(images_dir);
  } catch (const std::exception& e) {
    std::cerr << "Open failed: " << e.what() << "\n";
    return 1;
  }

  picstash::ImageService service(registry.get(), objects.get());

  if (cmd == "upload") {
    if (argc != 5) { usage(argv[0]); return 2; }
    std::string bytes;
    if (!ReadFile(argv[4], &bytes)) {
      std::cerr << "Cannot read " << argv[4] << "\n";
      return 1;
    }
    picstash::UploadResult result;
    s = service.Upload(std::filesystem::path(argv[4]).extension().string(), bytes, &result);
    if (!s.ok()) {
      std::cerr << "Upload failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << result.filename << "\n";
    return 0;
  } else if (cmd == "source") {
    if (argc != 5) { usage(argv[0]); return 2; }
    picstash::Resolution r;
    s = service.ResolveSource(argv[4], &r);
    if (!s.ok()) {
      std::cerr << "Lookup failed: " << s.ToString() << "\n";
      return 1;
    }
    switch (r.kind) {
      case picstash::Resolution::Kind::kRedirect:
        std::cout << "source=" << r.target << "\n";
        return 0;
      case picstash::Resolution::Kind::kServeLocal:
        std::cout << "local=" << r.target << "\n";
        return 0;
      case picstash::Resolution::Kind::kNotFound:
        break;
    }
    std::cerr << "not found\n";
    return 1;
  } else if (cmd == "set-source") {
    if (argc != 6) { usage(argv[0]); return 2; }
    std::string previous;
    s = service.SetSource(argv[4], argv[5], &previous);
    if (!s.ok()) {
      std::cerr << "SetSource failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK";
    if (!previous.empty()) std::cout << " previous=" << previous;
    std::cout << "\n";
    return 0;
  } else if (cmd == "delete") {
    if (argc != 5) { usage(argv[0]); return 2; }
    s = service.Delete(argv[4]);
    if (!s.ok()) {
      std::cerr << "Delete failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "count") {
    if (argc != 4) { usage(argv[0]); return 2; }
    uint64_t records = 0;
    s = registry->Count(&records);
    if (!s.ok()) {
      std::cerr << "Count failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "records=" << records << "\n";
    return 0;
  } else if (cmd == "sweep") {
    if (argc != 4 && argc != 5) { usage(argv[0]); return 2; }
    picstash::SweepStats stats;
    if (argc == 5) {
      uint64_t grace = 0;
      try {
        grace = std::stoull(argv[4]);
      } catch (const std::exception&) {
        std::cerr << "Invalid grace_s: " << argv[4] << "\n";
        return 2;
      }
      if (grace < picstash::kMinSweepGraceSeconds) {
        std::cerr << "grace_s must be at least " << picstash::kMinSweepGraceSeconds
                  << " (uploads in flight hold unwritten reservations)\n";
        return 2;
      }
      s = service.Sweep(grace, &stats);
    } else {
      s = service.Sweep(&stats);
    }
    if (!s.ok()) {
      std::cerr << "Sweep failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "records_scanned=" << stats.records_scanned << "\n"
              << "objects_scanned=" << stats.objects_scanned << "\n"
              << "orphan_records_removed=" << stats.orphan_records_removed << "\n"
              << "orphan_objects_removed=" << stats.orphan_objects_removed << "\n";
    return 0;
  } else {
    usage(argv[0]);
    return 2;
  }
}
