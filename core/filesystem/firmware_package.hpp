#ifndef __FIRMWARE_PACKAGE_HPP_
#define __FIRMWARE_PACKAGE_HPP_

#include <string>
#include <vector>
#include "base_types.hpp"

struct FirmwarePackage {
	ByteArray image;
	ByteArray init_data;
};

// Named files of a DFU package, either a .zip archive or an unpacked directory
class PackageArchive {
public:
	virtual ~PackageArchive() {}
	virtual std::vector<std::string> list() = 0;
	virtual ByteArray read(const std::string& name) = 0;
};

// Reads a DFU package. A .zip archive or a directory is resolved through its
// manifest.json, falling back to the first *application*.bin/.dat pair when
// there is no manifest. Any other file is taken as the image, with the init
// packet in a sibling .dat of the same stem.
class FirmwarePackageLoader {
private:
	static ByteArray read_file(const std::string& path);
	static FirmwarePackage load_archive(PackageArchive& archive, const std::string& path);
	static bool parse_manifest(const ByteArray& json, std::string& bin_file, std::string& dat_file);
	static std::string find_application_file(const std::vector<std::string>& names, const std::string& extension);

public:
	static constexpr const char *MANIFEST = "manifest.json";

	static FirmwarePackage load(const std::string& path);
};

#endif // __FIRMWARE_PACKAGE_HPP_
