/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>

#include <qtermdoc/QTermViewerOptions.hpp>

#include <cstdio>

namespace OptionsTests {
    inline bool testDefaults() {
        printf( "  testDefaults... " );

        const QTermViewerOptions opts;

        if ( (opts.cacheCapacity != 4) or (opts.quality != QTermViewerOptions::Balanced) or (opts.zoomPercent != 100) ) {
            printf( "FAILED: unexpected defaults\n" );
            return false;
        }

        if ( (opts.limits.maxRenderPixels != 8000000) or (opts.limits.maxTransmitPixels != 2000000) or (opts.limits.maxRenderWidth != 8192) ) {
            printf( "FAILED: balanced budgets\n" );
            return false;
        }

        if ( (opts.limits.minZoom != 50) or (opts.limits.maxZoom != 400) or (opts.limits.zoomStep != 25) ) {
            printf( "FAILED: zoom range\n" );
            return false;
        }

        if ( (opts.viewMode != QTermViewerOptions::ImageView) or (opts.textMode != QTermTextEngine::Reflow) ) {
            printf( "FAILED: start modes\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testQualityPresets() {
        printf( "  testQualityPresets... " );

        QTermViewerOptions opts;

        opts.applyQuality( QTermViewerOptions::Fast );

        if ( (opts.limits.maxRenderPixels != 4000000) or (opts.limits.maxTransmitPixels != 1000000) ) {
            printf( "FAILED: fast preset\n" );
            return false;
        }

        opts.applyQuality( QTermViewerOptions::Sharp );

        if ( (opts.limits.maxRenderPixels != 16000000) or (opts.limits.maxTransmitPixels != 4000000) ) {
            printf( "FAILED: sharp preset\n" );
            return false;
        }

        if ( QTermViewerOptions::qualityFromName( " SHARP ", QTermViewerOptions::Fast ) != QTermViewerOptions::Sharp ) {
            printf( "FAILED: preset names are case insensitive\n" );
            return false;
        }

        if ( QTermViewerOptions::qualityFromName( "ultra", QTermViewerOptions::Fast ) != QTermViewerOptions::Fast ) {
            printf( "FAILED: unknown preset\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testFromSettings() {
        printf( "  testFromSettings... " );

        QTemporaryDir dir;

        if ( not dir.isValid() ) {
            printf( "FAILED: no temporary directory\n" );
            return false;
        }

        const QString path = dir.filePath( "qtermdoc.conf" );

        {
            QSettings settings( path, QSettings::IniFormat );

            settings.setValue( "render/quality", "fast" );
            settings.setValue( "render/maxTransmitPixels", 500000 );
            settings.setValue( "render/cacheCapacity", "lots" );
            settings.setValue( "render/grayscale", "yes" );
            settings.setValue( "viewport/zoom", 150 );
            settings.setValue( "text/mode", "wrap" );
            settings.setValue( "text/trimFurniture", "off" );
            settings.setValue( "reader/mode", "text" );
            settings.sync();
        }

        QSettings                settings( path, QSettings::IniFormat );
        const QTermViewerOptions opts = QTermViewerOptions::fromSettings( settings );

        if ( (opts.quality != QTermViewerOptions::Fast) or (opts.limits.maxRenderPixels != 4000000) ) {
            printf( "FAILED: quality preset not read\n" );
            return false;
        }

        if ( opts.limits.maxTransmitPixels != 500000 ) {
            printf( "FAILED: explicit budget must override the preset\n" );
            return false;
        }

        if ( opts.cacheCapacity != 4 ) {
            printf( "FAILED: malformed value not ignored\n" );
            return false;
        }

        if ( (opts.colorMode != QTermRenderOptions::Grayscale) or (opts.zoomPercent != 150) ) {
            printf( "FAILED: render and viewport values\n" );
            return false;
        }

        if ( (opts.textMode != QTermTextEngine::Wrap) or opts.text.trimFurniture or (opts.viewMode != QTermViewerOptions::TextView) ) {
            printf( "FAILED: text and reader values\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool testNormalize() {
        printf( "  testNormalize... " );

        QTermViewerOptions opts;

        opts.cacheCapacity            = 0;
        opts.workerThreads            = -3;
        opts.zoomPercent              = 9000;
        opts.limits.maxRenderWidth    = 1000000;
        opts.limits.maxTransmitPixels = 99000000;
        opts.text.furnitureRatio      = 4.0;

        opts.normalize();

        if ( (opts.cacheCapacity != 1) or (opts.workerThreads != 1) or (opts.zoomPercent != 400) ) {
            printf( "FAILED: counts and zoom\n" );
            return false;
        }

        if ( (opts.limits.maxRenderWidth != QTERMDOC_MAX_RENDER_EDGE) or (opts.limits.maxTransmitPixels != opts.limits.maxRenderPixels) ) {
            printf( "FAILED: budgets\n" );
            return false;
        }

        if ( opts.text.furnitureRatio != 1.0 ) {
            printf( "FAILED: ratio\n" );
            return false;
        }

        printf( "PASSED\n" );
        return true;
    }


    inline bool runAllTests() {
        printf( "\nViewer options\n" );

        bool allPass = true;

        allPass &= testDefaults();
        allPass &= testQualityPresets();
        allPass &= testFromSettings();
        allPass &= testNormalize();

        return allPass;
    }
}
