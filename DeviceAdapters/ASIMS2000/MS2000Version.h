/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef MS2000VERSION_H
#define MS2000VERSION_H

#include <cctype>
#include <sstream>
#include <string>

// Firmware version of an MS-2000 controller.
// The format changed to match the Tiger controller after 9.2p:
// Old version format: ":A Version: USB-9.2k \r\n" (revision is a letter: 'a'-'z')
// New version format: ":A Version: USB-9.50 \r\n" (revision is a digit: '0'-'9')
class Version {
public:
	Version() : major_(0), minor_(0), rev_(0) { }
	explicit Version(unsigned int major, unsigned int minor, char rev)
		: major_(major), minor_(minor), rev_(rev) { }

	unsigned int GetMajor() const { return major_; }
	unsigned int GetMinor() const { return minor_; }
	char GetRevision() const { return rev_; }

	// A default constructed (or unparsable) version is 0.0
	bool IsKnown() const { return major_ != 0 || minor_ != 0; }

	bool IsVersionAtLeast(unsigned int major, unsigned int minor, char rev) const {
		if (major_ != major) {
			return major_ > major;
		}
		if (minor_ != minor) {
			return minor_ > minor;
		}
		// only meaningful when both revisions use the same format
		return rev_ >= rev;
	}

	// "9.2k", "9.50"
	std::string ToString() const {
		std::ostringstream os;
		os << major_ << "." << minor_;
		if (rev_ != 0) {
			os << rev_;
		}
		return os.str();
	}

	// Parse the text after the dash, e.g. "... USB-9.2k ..." => 9, 2, 'k'.
	// Returns a default Version if the text does not match.
	static Version ParseString(const std::string& version) {
		const size_t dashIndex = version.find('-');
		if (dashIndex == std::string::npos) {
			return Version();
		}
		const std::string ver = version.substr(dashIndex + 1);

		const size_t dotIndex = ver.find('.');
		if (dotIndex == std::string::npos || dotIndex == 0) {
			return Version();
		}

		// major versions may have more than one digit
		unsigned int major = 0;
		for (size_t i = 0; i < dotIndex; i++) {
			if (!std::isdigit(static_cast<unsigned char>(ver[i]))) {
				return Version();
			}
			major = major * 10 + static_cast<unsigned int>(ver[i] - '0');
		}

		// minor version and revision are one character each
		if (dotIndex + 2 >= ver.size() || !std::isdigit(static_cast<unsigned char>(ver[dotIndex + 1]))) {
			return Version();
		}
		const unsigned int minor = static_cast<unsigned int>(ver[dotIndex + 1] - '0');
		const char revision = ver[dotIndex + 2];
		if (!std::isalnum(static_cast<unsigned char>(revision))) {
			return Version();
		}
		return Version(major, minor, revision);
	}

	bool operator>=(const Version& other) const {
		return IsVersionAtLeast(other.major_, other.minor_, other.rev_);
	}

	bool operator==(const Version& other) const {
		return major_ == other.major_ && minor_ == other.minor_ && rev_ == other.rev_;
	}

private:
	unsigned int major_;
	unsigned int minor_;
	char rev_;
};

#endif // MS2000VERSION_H
