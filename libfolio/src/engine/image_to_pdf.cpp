//
// Created by Giuseppe Francione on 14/02/26.
//

#include "../../include/image_to_pdf.hpp"
#include "../../include/engine_lock.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "qpdf_support.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <exception>
#include <mutex>
#include <string>

namespace folio {

namespace {

constexpr auto kTag = "image_to_pdf";

QPDFObjectHandle make_image_xobject(QPDF& pdf, const Image& rgb) {
    QPDFObjectHandle image = pdf.newStream(std::string(rgb.pixels.begin(), rgb.pixels.end()));
    QPDFObjectHandle dict = image.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(rgb.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(rgb.height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceRGB"));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
    return image;
}

} // namespace

std::filesystem::path image_to_pdf(const ImageToPdfRequest& request, const CodecRegistry& codecs,
                                   IArtifactSink& sink, IProgressReporter* progress) {
    require_source(SourceDocument{request.image, {}}, "imagetopdf");
    const IImageCodec& codec = codecs.require(lowercase_extension(request.image));

    std::filesystem::path output = request.output;
    if (output.empty()) {
        output = request.image;
        output.replace_extension(".pdf");
    }

    Image rgb;
    try {
        rgb = to_rgb(codec.decode(request.image));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "imagetopdf: cannot decode " + request.image.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("imagetopdf: cannot decode " + request.image.string()));
    }
    report_progress(progress, 1, 2, request.image.string());

    std::lock_guard lock(engine_mutex());
    try {
        QpdfHandle handle;
        handle.create();
        QPDF& pdf = handle.get();

        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Im1", make_image_xobject(pdf, rgb));
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjects);

        const std::string content = "q " + std::to_string(rgb.width) + " 0 0 " + std::to_string(rgb.height) +
                                    " 0 0 cm /Im1 Do Q";
        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::newFromRectangle(
            QPDFObjectHandle::Rectangle(0, 0, rgb.width, rgb.height)));
        page.replaceKey("/Resources", resources);
        page.replaceKey("/Contents", pdf.newStream(content));

        QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(pdf.makeIndirectObject(page)), false);
        sink.write(output, write_to_memory(pdf, false));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "imagetopdf: cannot write " + output.string() + ": " + e.what(), kTag);
        std::throw_with_nested(OperationError("imagetopdf: cannot write " + output.string()));
    }
    report_progress(progress, 2, 2, output.string());

    Logger::log(LogLevel::Info, "imagetopdf: " + request.image.string() + " -> " + output.string(), kTag);
    return output;
}

} // namespace folio
