#include "DiagramExtractor.hpp"
#include "ThreadPool.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace textbook {

double scaledMinContourArea(const DiagramConfig &config, double zoom) {
  if (config.referenceZoom <= 0) {
    return config.minContourArea;
  }
  double ratio = zoom / config.referenceZoom;
  return config.minContourArea * ratio * ratio;
}

std::vector<DiagramRegion> detectDiagramRegions(const cv::Mat &raster,
                                                double zoom,
                                                const PageSize &pageSize,
                                                const DiagramConfig &config) {
  std::vector<DiagramRegion> regions;

  if (raster.empty() || zoom <= 0) {
    return regions;
  }

  // Convert to grayscale for analysis
  cv::Mat gray;
  if (raster.channels() == 3) {
    cv::cvtColor(raster, gray, cv::COLOR_BGR2GRAY);
  } else if (raster.channels() == 4) {
    cv::cvtColor(raster, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = raster.clone();
  }

  // Blur away antialiasing fringes, then make dark ink the foreground
  cv::GaussianBlur(gray, gray,
                   cv::Size(config.blurKernelSize, config.blurKernelSize), 0);
  cv::Mat binary;
  cv::threshold(gray, binary, config.inkThreshold, 255, cv::THRESH_BINARY_INV);

  // Outermost shapes only, nested strokes belong to their parent
  std::vector<std::vector<cv::Point>> contours;
  std::vector<cv::Vec4i> hierarchy;
  cv::findContours(binary, contours, hierarchy, cv::RETR_EXTERNAL,
                   cv::CHAIN_APPROX_SIMPLE);

  const double minArea = scaledMinContourArea(config, zoom);

  for (size_t i = 0; i < contours.size(); i++) {
    double area = cv::contourArea(contours[i]);
    if (area < minArea) {
      continue;
    }

    cv::Rect boundingRect = cv::boundingRect(contours[i]) &
                            cv::Rect(0, 0, raster.cols, raster.rows);
    if (boundingRect.empty()) {
      continue;
    }

    // Back to page units. The raster may be a pixel larger than the page
    // after rounding, so clamp to the page rectangle.
    double left = std::min(boundingRect.x / zoom, pageSize.width);
    double top = std::min(boundingRect.y / zoom, pageSize.height);
    double right =
        std::min((boundingRect.x + boundingRect.width) / zoom, pageSize.width);
    double bottom = std::min((boundingRect.y + boundingRect.height) / zoom,
                             pageSize.height);

    if (right <= left || bottom <= top) {
      continue;
    }

    DiagramRegion region;
    region.contourIndex = static_cast<int>(i);
    region.area = area;
    region.pixelRect = boundingRect;
    region.x = left;
    region.y = top;
    region.width = right - left;
    region.height = bottom - top;
    regions.push_back(region);
  }

  return regions;
}

std::string diagramFileName(int pageNumber, int diagramNumber) {
  return "page_" + std::to_string(pageNumber) + "_diagram_" +
         std::to_string(diagramNumber) + ".jpg";
}

DiagramExtractor::DiagramExtractor(std::string bookName,
                                   std::string outputDir,
                                   DiagramConfig config)
    : m_bookName(std::move(bookName)), m_outputDir(std::move(outputDir)),
      m_config(config) {
  if (m_config.zoom <= 0) {
    throw std::invalid_argument("Zoom must be positive");
  }
  if (m_config.blurKernelSize < 1 || m_config.blurKernelSize % 2 == 0) {
    throw std::invalid_argument("Blur kernel size must be odd and positive");
  }
}

std::vector<Diagram>
DiagramExtractor::extractFromRaster(const cv::Mat &raster,
                                    const PageSize &pageSize,
                                    int pageNumber) const {
  std::vector<Diagram> diagrams;

  std::vector<DiagramRegion> regions =
      detectDiagramRegions(raster, m_config.zoom, pageSize, m_config);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << pageNumber << ": " << regions.size()
              << " diagram regions above "
              << scaledMinContourArea(m_config, m_config.zoom) << " px^2"
              << std::endl;
  }

  const std::vector<int> writeParams = {cv::IMWRITE_JPEG_QUALITY,
                                        m_config.jpegQuality};

  for (const auto &region : regions) {
    std::string fileName =
        diagramFileName(pageNumber, region.contourIndex + 1);
    std::filesystem::path filePath =
        std::filesystem::path(m_outputDir) / fileName;

    // Crop from the rendered raster, quality follows the zoom
    cv::Mat crop = raster(region.pixelRect);
    if (!cv::imwrite(filePath.string(), crop, writeParams)) {
      throw std::runtime_error("Failed to write diagram image: " +
                               filePath.string());
    }

    diagrams.emplace_back(pageNumber, region.x, region.y, region.width,
                          region.height,
                          "/images/" + m_bookName + "/" + fileName);
  }

  if (m_config.writePagePreviews) {
    writePreview(raster, regions, pageNumber);
  }

  return diagrams;
}

std::vector<Diagram>
DiagramExtractor::extractPage(const PageRasterizer &rasterizer,
                              int pageNumber) const {
  cv::Mat raster = rasterizer.render(pageNumber, m_config.zoom);
  return extractFromRaster(raster, rasterizer.pageSize(pageNumber),
                           pageNumber);
}

std::vector<Diagram>
DiagramExtractor::extract(const std::string &pdfPath) const {
  // Opening once up front turns an unreadable file into a single error
  PageRasterizer rasterizer(pdfPath);
  const int pageCount = rasterizer.pageCount();

  size_t workers = m_config.workers > 0
                       ? m_config.workers
                       : std::max(1u, std::thread::hardware_concurrency());
  workers = std::min(workers, static_cast<size_t>(pageCount));

  std::vector<Diagram> diagrams;

  if (workers <= 1) {
    for (int page = 1; page <= pageCount; page++) {
      std::vector<Diagram> pageDiagrams = extractPage(rasterizer, page);
      diagrams.insert(diagrams.end(), pageDiagrams.begin(),
                      pageDiagrams.end());
    }
    return diagrams;
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Extracting diagrams from " << pageCount
              << " pages with " << workers << " workers" << std::endl;
  }

  ThreadPool pool(workers);
  std::vector<std::future<std::vector<Diagram>>> futures;
  futures.reserve(pageCount);

  for (int page = 1; page <= pageCount; page++) {
    futures.push_back(pool.enqueue([this, &pdfPath, page]() {
      PageRasterizer workerRasterizer(pdfPath);
      return extractPage(workerRasterizer, page);
    }));
  }

  // Collect in page order so the result does not depend on scheduling
  for (auto &future : futures) {
    std::vector<Diagram> pageDiagrams = future.get();
    diagrams.insert(diagrams.end(), pageDiagrams.begin(), pageDiagrams.end());
  }

  return diagrams;
}

void DiagramExtractor::writePreview(const cv::Mat &raster,
                                    const std::vector<DiagramRegion> &regions,
                                    int pageNumber) const {
  cv::Mat preview = raster.clone();
  for (const auto &region : regions) {
    cv::rectangle(preview, region.pixelRect, cv::Scalar(255, 0, 0), 2);
    cv::putText(preview, std::to_string(region.contourIndex + 1),
                cv::Point(region.pixelRect.x + 4, region.pixelRect.y + 24),
                cv::FONT_HERSHEY_SIMPLEX, 0.8, cv::Scalar(255, 0, 0), 2);
  }

  // Kept apart from the crops, the book folder holds one file per diagram
  std::filesystem::path previewDir =
      std::filesystem::path(m_outputDir) / "previews";
  std::error_code ec;
  std::filesystem::create_directories(previewDir, ec);
  std::filesystem::path previewPath =
      previewDir / ("page_" + std::to_string(pageNumber) + "_preview.jpg");
  if (ec || !cv::imwrite(previewPath.string(), preview)) {
    std::cerr << "Failed to write page preview: " << previewPath.string()
              << std::endl;
  }
}

} // namespace textbook
