#include <catch2/catch_all.hpp>
#include <documents/pdf/dcx_pdf_loader.h>
#include <documents/dcx_document.h>
#include <comparison/dcx_compare_exceptions.h>
#include <filesystem>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

SCENARIO("Rendered page file names", "[unit][pdf]") {
    THEN("The trailing number is the page number") {
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page-1.png") == 1);
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page-07.png") == 7);
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page-123.png") == 123);
    }

    THEN("Names without a number are rejected") {
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page.png") == -1);
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page-.png") == -1);
        REQUIRE(dcx_pdf_loader::page_number_from_filename("page-x.png") == -1);
    }
}

SCENARIO("Files that are not PDFs", "[unit][pdf]") {
    GIVEN("A missing file and a text file named .pdf") {
        std::filesystem::path fake = std::filesystem::temp_directory_path() / "dcx_not_a.pdf";
        std::ofstream(fake.string()) << "plain text, no PDF header";

        THEN("They have no page count and do not load") {
            std::vector<cv::Mat> pages;
            REQUIRE(dcx_pdf_loader::page_count("/nonexistent/file.pdf") == -1);
            REQUIRE(dcx_pdf_loader::page_count(fake.string()) == -1);
            REQUIRE_FALSE(dcx_pdf_loader().load(fake.string(), pages));
            REQUIRE(pages.empty());
        }

        THEN("Opening one as a document fails") {
            REQUIRE_THROWS_AS(dcx_document::from_file(fake.string(), dcx_compare_config::defaults()),
                              dcx_document_load_error);
        }

        std::filesystem::remove(fake);
    }
}

namespace {

  // Smallest valid one page PDF, xref offsets computed while writing
  void write_blank_pdf(const std::filesystem::path& file) {
    std::vector<std::string> objects = {
      "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n",
      "2 0 obj\n<< /Type /Pages /Kids [3 0 R] /Count 1 >>\nendobj\n",
      "3 0 obj\n<< /Type /Page /Parent 2 0 R /MediaBox [0 0 200 200] >>\nendobj\n"};

    std::string body = "%PDF-1.4\n";
    std::vector<size_t> offsets;
    for (const std::string& object : objects) {
      offsets.push_back(body.size());
      body += object;
    }

    size_t xref_offset = body.size();
    body += "xref\n0 4\n0000000000 65535 f \n";
    for (size_t offset : offsets) {
      char entry[32];
      std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offset);
      body += entry;
    }
    body += "trailer\n<< /Size 4 /Root 1 0 R >>\nstartxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";

    std::ofstream out(file.string(), std::ios::binary);
    out << body;
  }

}

SCENARIO("PDF paths with shell characters", "[integration][pdf]") {
    GIVEN("A real PDF whose name closes the quote and appends a command") {
        std::filesystem::path dir = std::filesystem::temp_directory_path() / "dcx_quoted_pdf_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        std::filesystem::path marker = std::filesystem::current_path() / "dcx_injected_marker";
        std::filesystem::remove(marker);
        std::filesystem::path pdf = dir / "deck'; touch dcx_injected_marker; echo '.pdf";
        write_blank_pdf(pdf);

        WHEN("It is loaded") {
            REQUIRE(dcx_pdf_loader::page_count(pdf.string()) == 1);
            std::vector<cv::Mat> pages;
            bool ok = dcx_pdf_loader(120, 90, 36).load(pdf.string(), pages);

            THEN("No command from the name runs") {
                REQUIRE_FALSE(std::filesystem::exists(marker));
                if (ok) {
                    REQUIRE(pages.size() == 1);
                }
            }
        }

        std::filesystem::remove(marker);
        std::filesystem::remove_all(dir);
    }

    GIVEN("The render command") {
        dcx_string cmd = dcx_pdf_loader::render_command("/tmp/dcx_pdf_render_1/input.pdf", "/tmp/dcx_pdf_render_1/page", 150);

        THEN("It names only the staged copy and the output prefix") {
            REQUIRE(cmd == "pdftoppm -png -r 150 '/tmp/dcx_pdf_render_1/input.pdf' '/tmp/dcx_pdf_render_1/page'");
        }
    }
}
