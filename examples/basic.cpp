#include <picstash/image_service.hpp>
#include <picstash/object_store.hpp>
#include <picstash/rocks_registry.hpp>

#include <iostream>

int main() {
  std::unique_ptr<picstash::RocksRegistry> registry;
  auto s = picstash::RocksRegistry::Open("./picstash_db", &registry);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  picstash::FileObjectStore objects("./picstash_images");
  picstash::ImageService service(registry.get(), &objects);

  picstash::UploadResult uploaded;
  s = service.Upload(".png", "\x89PNG not really", &uploaded);
  if (!s.ok()) {
    std::cerr << "Upload failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "stored " << uploaded.filename << "\n";

  s = service.SetSource(uploaded.id, "https://example.com/original.png", nullptr);
  if (!s.ok()) std::cerr << "SetSource failed: " << s.ToString() << "\n";

  std::vector<std::optional<std::string>> sources;
  s = service.GetSources({uploaded.id, "nosuch"}, &sources);
  if (!s.ok()) {
    std::cerr << "GetSources failed: " << s.ToString() << "\n";
    return 1;
  }
  for (const auto& src : sources) {
    std::cout << (src ? *src : "(null)") << "\n";
  }

  // Unsupported types are refused before any id is claimed.
  picstash::UploadResult rejected;
  s = service.Upload(".svg", "<svg/>", &rejected);
  std::cout << ".svg upload: " << s.ToString() << "\n";

  s = service.Delete(uploaded.id);
  if (!s.ok()) std::cerr << "Delete failed: " << s.ToString() << "\n";

  std::cout << "done\n";
  return 0;
}
