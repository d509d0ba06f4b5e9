/**
 * @file VolumeIO.h
 * @brief Whole-volume inputs and outputs: location masks and accuracy maps
 *
 * Volume locations are addressed by linear index with x varying fastest,
 * which is both the ITK buffer order and the order used by the producers of
 * searchlight streams.
 */

#ifndef NEURODECODE_VOLUME_IO_H
#define NEURODECODE_VOLUME_IO_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "itkImage.h"
#include "vnl/vnl_matrix.h"

namespace neurodecode {
namespace io {

struct VolumeGeometry {
  std::array<size_t, 3> dimensions = {{53, 63, 46}}; // [nx, ny, nz]
  std::array<double, 3> spacing = {{1.0, 1.0, 1.0}}; // mm
  std::array<double, 3> origin = {{0.0, 0.0, 0.0}};  // mm

  size_t GetNumberOfVoxels() const {
    return dimensions[0] * dimensions[1] * dimensions[2];
  }
};

/**
 * @brief Per-location inclusion flags over the whole volume
 *
 * A location takes part in the analysis when its value is at least the
 * threshold (0.5 on the usual 0..1 scale).
 */
class LocationMask {
public:
  using PixelType = float;
  using ImageType = itk::Image<PixelType, 3>;

private:
  std::vector<float> m_values;
  VolumeGeometry m_geometry;
  double m_threshold;

public:
  LocationMask(std::vector<float> values, const VolumeGeometry &geometry,
               double threshold = 0.5);

  /// Flat little-endian float32 file holding one value per voxel.
  static LocationMask ReadRawFile(const std::string &filename,
                                  const VolumeGeometry &geometry,
                                  double threshold = 0.5);

  /// Any scalar image ITK can read; geometry is taken from the image.
  static LocationMask ReadImageFile(const std::string &filename,
                                    double threshold = 0.5);

  /// Chooses between the two readers by file extension.
  static LocationMask Read(const std::string &filename,
                           const VolumeGeometry &geometry,
                           double threshold = 0.5);

  static bool IsRawFile(const std::string &filename);

  /// Throws ShapeMismatchException for indices outside the volume.
  bool IsIncluded(size_t linear_index) const;
  float GetValue(size_t linear_index) const;

  size_t GetNumberOfLocations() const { return m_values.size(); }
  size_t CountIncluded() const;
  double GetThreshold() const { return m_threshold; }
  const VolumeGeometry &GetGeometry() const { return m_geometry; }
};

/**
 * @brief Writes one volume per decoded variable
 *
 * Each searchlight statistic is placed at its center location; every other
 * voxel is zero.
 */
class AccuracyMapWriter {
public:
  using PixelType = float;
  using ImageType = itk::Image<PixelType, 3>;

private:
  VolumeGeometry m_geometry;
  int m_index_base;

public:
  AccuracyMapWriter(const VolumeGeometry &geometry, int index_base = 1);

  /**
   * @brief Build the map of one variable
   * @param accuracy variables x searchlights matrix
   * @param variable row of accuracy to place
   * @param location_ids global location identifier of every column, stored
   *        with the writer's index base
   */
  ImageType::Pointer BuildMap(const vnl_matrix<double> &accuracy,
                              unsigned variable,
                              const std::vector<int32_t> &location_ids) const;

  /**
   * @brief Write "<prefix>_var<i>.nii.gz" for every variable
   * @return the written filenames
   */
  std::vector<std::string>
  WriteMaps(const std::string &prefix, const vnl_matrix<double> &accuracy,
            const std::vector<int32_t> &location_ids) const;
};

} // namespace io
} // namespace neurodecode

#endif // NEURODECODE_VOLUME_IO_H
