#include "WavWriter.h"
#include <juce_audio_formats/juce_audio_formats.h>

namespace Phonoclip
{

bool WavWriter::write (const PcmBuffer& pcm, const juce::File& dest, juce::String& error)
{
    const auto& format = pcm.format;

    if (! format.isValid())
    {
        error = "invalid PCM format " + format.toString();
        return false;
    }

    if (dest.isDirectory())
    {
        error = "destination is a directory: " + dest.getFullPathName();
        return false;
    }

    if (! dest.getParentDirectory().isDirectory())
    {
        error = "directory does not exist: " + dest.getParentDirectory().getFullPathName();
        return false;
    }

    juce::TemporaryFile temp (dest);

    {
        auto out = std::make_unique<juce::FileOutputStream> (temp.getFile());
        if (! out->openedOk())
        {
            error = "could not open " + temp.getFile().getFullPathName() + " for writing: " + out->getStatus().getErrorMessage();
            return false;
        }

        juce::WavAudioFormat wav;
        std::unique_ptr<juce::AudioFormatWriter> writer (wav.createWriterFor (out.get(),
                                                                               (double) format.sampleRate,
                                                                               (unsigned int) format.numChannels,
                                                                               format.bytesPerSample * 8,
                                                                               {}, 0));
        if (writer == nullptr)
        {
            error = "could not create a WAV writer for " + format.toString();
            return false;
        }

        out.release(); // now owned by the writer

        const int numChannels = format.numChannels;
        const int width = format.bytesPerSample;
        const int frameSize = format.getFrameSize();
        const auto totalFrames = pcm.getNumFrames();
        auto* src = static_cast<const juce::uint8*> (pcm.data.getData());

        juce::HeapBlock<int> storage ((size_t) numChannels * (size_t) framesPerBlock, true);
        // Null-terminated, as AudioFormatWriter::write() expects.
        juce::HeapBlock<const int*> channels ((size_t) numChannels + 1, true);

        for (int ch = 0; ch < numChannels; ++ch)
            channels[ch] = storage.get() + (size_t) ch * (size_t) framesPerBlock;

        for (juce::int64 start = 0; start < totalFrames; start += framesPerBlock)
        {
            const int numFrames = (int) juce::jmin ((juce::int64) framesPerBlock, totalFrames - start);

            for (int frame = 0; frame < numFrames; ++frame)
            {
                for (int ch = 0; ch < numChannels; ++ch)
                {
                    const auto* sample = src + (size_t) (start + frame) * (size_t) frameSize + (size_t) (ch * width);
                    // The writer expects left-justified 32-bit integers.
                    storage[(size_t) ch * (size_t) framesPerBlock + (size_t) frame]
                        = (int) ((juce::int64) readSample (sample, width) * (((juce::int64) 1) << (32 - 8 * width)));
                }
            }

            if (! writer->write (channels.get(), numFrames))
            {
                error = "write failed after " + juce::String (start) + " frames";
                return false;
            }
        }

        writer.reset();
    }

    if (! temp.overwriteTargetFileWithTemporary())
    {
        error = "could not replace " + dest.getFullPathName();
        return false;
    }

    return true;
}

} // namespace Phonoclip
