#ifndef DCX_DOCUMENT_H
#define DCX_DOCUMENT_H

#include "dcx_page.h"
#include "../comparison/dcx_compare_config.h"
#include <vector>

class dcx_thumbnail_cache;

/**
 * An ordered set of rendered pages from one PDF or one image folder.
 */
class dcx_document
{
public:
  enum document_type { pdf, images };

private:
  dcx_string doc_path;
  document_type doc_type;
  std::vector<dcx_page> doc_pages;
  bool loaded;

public:
  dcx_document(const dcx_string& path, document_type type);

  /**
   * Directories are image folders, *.pdf files are PDFs.
   * @throws dcx_document_load_error for missing paths or other file types
   */
  static document_type detect_type(const dcx_string& path);

  /**
   * Loads and rasterizes a document. Thumbnails come from the cache when
   * it is open and holds a current entry; fresh renders are stored back.
   * @throws dcx_document_load_error if nothing could be loaded
   */
  static dcx_document from_file(const dcx_string& path, const dcx_compare_config& config,
                                dcx_thumbnail_cache* cache = nullptr);

  // In-memory document, one page per image
  static dcx_document from_images(const dcx_string& name, const std::vector<cv::Mat>& images);

  void set_pages(const std::vector<cv::Mat>& thumbnails);

  const dcx_string& path() const { return doc_path; }
  document_type type() const { return doc_type; }
  dcx_string name() const;
  size_t page_count() const { return doc_pages.size(); }
  bool is_loaded() const { return loaded; }

  std::vector<dcx_page>& pages() { return doc_pages; }
  const std::vector<dcx_page>& pages() const { return doc_pages; }
  const dcx_page& page(size_t index) const { return doc_pages.at(index); }

  size_t ensure_fingerprints(const dcx_fingerprint_provider& provider, int max_workers = 4);

  static dcx_string type_to_string(document_type type);
};

#endif // DCX_DOCUMENT_H
