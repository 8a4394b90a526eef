#include "dcx_document.h"
#include "dcx_image_folder_loader.h"
#include "dcx_thumbnail_cache.h"
#include "pdf/dcx_pdf_loader.h"
#include "../comparison/dcx_compare_exceptions.h"
#include <filesystem>
#include <iostream>

dcx_document::dcx_document(const dcx_string& path, document_type type)
  : doc_path(path), doc_type(type), loaded(false)
{
}

dcx_document::document_type dcx_document::detect_type(const dcx_string& path)
{
  std::error_code ec;
  if (std::filesystem::is_directory(path.to_std_const(), ec)) {
    return images;
  }
  if (!std::filesystem::exists(path.to_std_const(), ec)) {
    throw dcx_document_load_error(path, "file not found");
  }
  if (path.lower().ends_with(".pdf")) {
    return pdf;
  }
  throw dcx_document_load_error(path, "unsupported file type");
}

dcx_document dcx_document::from_file(const dcx_string& path, const dcx_compare_config& config,
                                     dcx_thumbnail_cache* cache)
{
  dcx_document doc(path, detect_type(path));
  int width = static_cast<int>(*config.thumbnail_width);
  int height = static_cast<int>(*config.thumbnail_height);
  int dpi = doc.doc_type == pdf ? static_cast<int>(*config.render_dpi) : 0;
  dcx_string profile = dcx_thumbnail_cache::render_profile(width, height, dpi);

  std::vector<cv::Mat> thumbnails;
  if (cache != nullptr && cache->lookup(path, profile, thumbnails)) {
    doc.set_pages(thumbnails);
    return doc;
  }

  bool ok = false;
  if (doc.doc_type == pdf) {
    dcx_pdf_loader loader(width, height, dpi);
    ok = loader.load(path, thumbnails);
  } else {
    dcx_image_folder_loader loader(width, height);
    ok = loader.load(path, thumbnails);
  }
  if (!ok) {
    throw dcx_document_load_error(path, "rendering failed");
  }

  if (cache != nullptr && cache->is_open() && doc.doc_type == pdf) {
    if (!cache->store(path, profile, thumbnails)) {
      std::cerr << "[cache] No cache entry written for " << path.c_str() << std::endl;
    }
  }
  doc.set_pages(thumbnails);
  return doc;
}

dcx_document dcx_document::from_images(const dcx_string& name, const std::vector<cv::Mat>& images)
{
  dcx_document doc(name, dcx_document::images);
  doc.set_pages(images);
  return doc;
}

void dcx_document::set_pages(const std::vector<cv::Mat>& thumbnails)
{
  doc_pages.clear();
  doc_pages.reserve(thumbnails.size());
  for (size_t i = 0; i < thumbnails.size(); ++i) {
    doc_pages.push_back(dcx_page(static_cast<int>(i), thumbnails[i]));
  }
  loaded = true;
}

dcx_string dcx_document::name() const
{
  std::filesystem::path p(doc_path.to_std_const());
  if (!p.has_filename()) {
    p = p.parent_path();
  }
  return p.filename().string();
}

size_t dcx_document::ensure_fingerprints(const dcx_fingerprint_provider& provider, int max_workers)
{
  return dcx_ensure_fingerprints(doc_pages, provider, max_workers);
}

dcx_string dcx_document::type_to_string(document_type type)
{
  return type == pdf ? "pdf" : "images";
}
