/**
 * @file VolumeIO.cpp
 * @brief Implementation of location mask reading and accuracy map writing
 */

#include "VolumeIO.h"
#include "../core/NeuroDecodeExceptions.h"
#include "CompatUtils.h"
#include "GzFile.h"

#include "itkImageFileReader.h"
#include "itkImageFileWriter.h"

namespace neurodecode {
namespace io {

// ===== LocationMask Implementation =====

LocationMask::LocationMask(std::vector<float> values,
                           const VolumeGeometry &geometry, double threshold)
    : m_values(std::move(values)), m_geometry(geometry),
      m_threshold(threshold) {
  if (m_values.size() != m_geometry.GetNumberOfVoxels()) {
    throw ShapeMismatchException("LocationMask", "mask voxel count",
                                 m_geometry.GetNumberOfVoxels(),
                                 m_values.size());
  }
}

bool LocationMask::IsRawFile(const std::string &filename) {
  return compat::has_extension(filename, ".raw") ||
         compat::has_extension(filename, ".bin") ||
         compat::has_extension(filename, ".img");
}

LocationMask LocationMask::ReadRawFile(const std::string &filename,
                                       const VolumeGeometry &geometry,
                                       double threshold) {
  GzInputFile file(filename);

  const size_t num_voxels = geometry.GetNumberOfVoxels();
  std::vector<float> values(num_voxels);
  size_t bytes_read = file.Read(values.data(), num_voxels * sizeof(float));
  if (bytes_read != num_voxels * sizeof(float)) {
    throw ShapeMismatchException("LocationMask", "raw mask voxel count",
                                 num_voxels, bytes_read / sizeof(float));
  }

  char extra = 0;
  if (file.Read(&extra, 1) != 0) {
    throw ShapeMismatchException("LocationMask", "raw mask voxel count",
                                 num_voxels, num_voxels + 1);
  }

  if (!IsHostLittleEndian()) {
    for (auto &value : values) {
      SwapEndianness(value);
    }
  }

  return LocationMask(std::move(values), geometry, threshold);
}

LocationMask LocationMask::ReadImageFile(const std::string &filename,
                                         double threshold) {
  try {
    auto reader = itk::ImageFileReader<ImageType>::New();
    reader->SetFileName(filename);
    reader->Update();
    ImageType::Pointer image = reader->GetOutput();

    if (!image) {
      throw DataIOException(filename, "ReadImageFile",
                            "image pointer is null after loading");
    }

    const auto region = image->GetLargestPossibleRegion();
    const auto size = region.GetSize();
    const auto spacing = image->GetSpacing();
    const auto origin = image->GetOrigin();

    VolumeGeometry geometry;
    for (unsigned d = 0; d < 3; ++d) {
      geometry.dimensions[d] = size[d];
      geometry.spacing[d] = spacing[d];
      geometry.origin[d] = origin[d];
    }

    const PixelType *buffer = image->GetBufferPointer();
    std::vector<float> values(buffer, buffer + region.GetNumberOfPixels());

    return LocationMask(std::move(values), geometry, threshold);
  } catch (const NeuroDecodeException &) {
    throw;
  } catch (const std::exception &e) {
    throw DataIOException(filename, "ReadImageFile", e.what());
  }
}

LocationMask LocationMask::Read(const std::string &filename,
                                const VolumeGeometry &geometry,
                                double threshold) {
  if (IsRawFile(filename)) {
    return ReadRawFile(filename, geometry, threshold);
  }
  return ReadImageFile(filename, threshold);
}

float LocationMask::GetValue(size_t linear_index) const {
  if (linear_index >= m_values.size()) {
    throw ShapeMismatchException("LocationMask", "location index",
                                 m_values.size(), linear_index);
  }
  return m_values[linear_index];
}

bool LocationMask::IsIncluded(size_t linear_index) const {
  return GetValue(linear_index) >= m_threshold;
}

size_t LocationMask::CountIncluded() const {
  size_t count = 0;
  for (float value : m_values) {
    if (value >= m_threshold) {
      ++count;
    }
  }
  return count;
}

// ===== AccuracyMapWriter Implementation =====

AccuracyMapWriter::AccuracyMapWriter(const VolumeGeometry &geometry,
                                     int index_base)
    : m_geometry(geometry), m_index_base(index_base) {}

AccuracyMapWriter::ImageType::Pointer
AccuracyMapWriter::BuildMap(const vnl_matrix<double> &accuracy,
                            unsigned variable,
                            const std::vector<int32_t> &location_ids) const {
  if (location_ids.size() != accuracy.cols()) {
    throw ShapeMismatchException("AccuracyMapWriter", "location id count",
                                 accuracy.cols(), location_ids.size());
  }
  if (variable >= accuracy.rows()) {
    throw ShapeMismatchException("AccuracyMapWriter", "variable index",
                                 accuracy.rows(), variable);
  }

  ImageType::SizeType size;
  ImageType::SpacingType spacing;
  ImageType::PointType origin;
  for (unsigned d = 0; d < 3; ++d) {
    size[d] = m_geometry.dimensions[d];
    spacing[d] = m_geometry.spacing[d];
    origin[d] = m_geometry.origin[d];
  }

  ImageType::IndexType start;
  start.Fill(0);
  ImageType::RegionType region(start, size);

  auto image = ImageType::New();
  image->SetRegions(region);
  image->SetSpacing(spacing);
  image->SetOrigin(origin);
  image->Allocate();
  image->FillBuffer(0.0f);

  const size_t num_voxels = m_geometry.GetNumberOfVoxels();
  PixelType *buffer = image->GetBufferPointer();
  for (size_t i = 0; i < location_ids.size(); ++i) {
    int64_t linear = static_cast<int64_t>(location_ids[i]) - m_index_base;
    if (linear < 0 || linear >= static_cast<int64_t>(num_voxels)) {
      throw ShapeMismatchException("AccuracyMapWriter", "location index",
                                   num_voxels,
                                   static_cast<size_t>(location_ids[i]));
    }
    buffer[linear] =
        static_cast<PixelType>(accuracy(variable, static_cast<unsigned>(i)));
  }

  return image;
}

std::vector<std::string>
AccuracyMapWriter::WriteMaps(const std::string &prefix,
                             const vnl_matrix<double> &accuracy,
                             const std::vector<int32_t> &location_ids) const {
  std::vector<std::string> filenames;

  for (unsigned v = 0; v < accuracy.rows(); ++v) {
    const std::string filename =
        prefix + "_var" + std::to_string(v + 1) + ".nii.gz";
    auto image = BuildMap(accuracy, v, location_ids);

    try {
      auto writer = itk::ImageFileWriter<ImageType>::New();
      writer->SetFileName(filename);
      writer->SetInput(image);
      writer->Update();
    } catch (const std::exception &e) {
      throw DataIOException(filename, "WriteMaps", e.what());
    }

    filenames.push_back(filename);
  }

  return filenames;
}

} // namespace io
} // namespace neurodecode
