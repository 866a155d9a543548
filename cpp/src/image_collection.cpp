/**
 * @file image_collection.cpp
 * @brief Storage, lookup and filtering of generated images
 */

#include "mirror_core.hpp"
#include <algorithm>
#include <stdexcept>

namespace mirror {

const Image& ImageCollection::at(int index) const {
    if (index < 0 || index >= count()) {
        throw std::out_of_range("image index " + std::to_string(index) +
                                " out of range [0, " + std::to_string(count()) + ")");
    }
    return images_[index];
}

void ImageCollection::append(Image image) {
    const bool shapeOk =
        image.xyz.rows() == nSources_ &&
        image.dist.rows() == nReceivers_ && image.dist.cols() == nSources_ &&
        image.vec.x.rows() == nReceivers_ && image.vec.x.cols() == nSources_ &&
        image.vec.y.rows() == nReceivers_ && image.vec.y.cols() == nSources_ &&
        image.vec.z.rows() == nReceivers_ && image.vec.z.cols() == nSources_ &&
        image.grazing.rows() == nReceivers_ && image.grazing.cols() == nSources_ &&
        image.rcoeff.rows() == nReceivers_ && image.rcoeff.cols() == nSources_;
    if (!shapeOk) {
        throw std::invalid_argument("image fields must be " + std::to_string(nReceivers_) +
                                    " receivers x " + std::to_string(nSources_) + " sources");
    }
    images_.push_back(std::move(image));
}

int ImageCollection::find(const Breadcrumb& crumb) const {
    for (int n = 0; n < count(); ++n) {
        if (images_[n].breadcrumb == crumb) {
            return n;
        }
    }
    return -1;
}

std::vector<int> ImageCollection::breadcrumbs_to_indices(const std::vector<Breadcrumb>& crumbs) const {
    std::vector<int> index;
    index.reserve(crumbs.size());
    for (const auto& crumb : crumbs) {
        int n = find(crumb);
        if (n >= 0) {
            index.push_back(n);
        }
    }
    return index;
}

void ImageCollection::retain(const std::vector<int>& indices) {
    // Validate everything first so a bad index leaves the collection intact
    for (int n : indices) {
        if (n < 0 || n >= count()) {
            throw std::out_of_range("cannot retain image " + std::to_string(n) +
                                    ": collection holds " + std::to_string(count()) + " images");
        }
    }

    std::vector<Image> kept;
    kept.reserve(indices.size());
    for (int n : indices) {
        kept.push_back(images_[n]);
    }
    images_.swap(kept);
}

std::vector<int> ImageCollection::all_indices() const {
    std::vector<int> index(images_.size());
    for (int n = 0; n < count(); ++n) {
        index[n] = n;
    }
    return index;
}

Real ImageCollection::max_distance() const {
    Real dmax = 0.0;
    for (const auto& img : images_) {
        if (img.dist.size() > 0) {
            dmax = std::max(dmax, img.dist.maxCoeff());
        }
    }
    return dmax;
}

} // namespace mirror
