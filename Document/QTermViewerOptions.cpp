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

#include <qtermdoc/QTermViewerOptions.hpp>

#include <limits>

/*
 * Read @key as a number, keeping @value when missing or malformed
 */
template<typename T>
static void readNumber( QSettings& settings, const QString& key, T& value ) {
    if ( not settings.contains( key ) ) {
        return;
    }

    bool         ok  = false;
    const double num = settings.value( key ).toDouble( &ok );

    if ( not ok ) {
        qWarning() << "Ignoring malformed setting" << key << settings.value( key );
        return;
    }

    value = static_cast<T>(qBound( (double)std::numeric_limits<T>::lowest(), num, (double)std::numeric_limits<T>::max() ) );
}


static void readBool( QSettings& settings, const QString& key, bool& value ) {
    if ( not settings.contains( key ) ) {
        return;
    }

    const QString str = settings.value( key ).toString().trimmed().toLower();

    if ( (str == "true") or (str == "1") or (str == "yes") or (str == "on") ) {
        value = true;
    }

    else if ( (str == "false") or (str == "0") or (str == "no") or (str == "off") ) {
        value = false;
    }

    else {
        qWarning() << "Ignoring malformed setting" << key << settings.value( key );
    }
}


QTermViewerOptions::QTermViewerOptions() {
    applyQuality( Balanced );
}


void QTermViewerOptions::applyQuality( Quality preset ) {
    quality = preset;

    switch ( preset ) {
        case Fast: {
            limits.maxRenderPixels   = 4000000;
            limits.maxTransmitPixels = 1000000;
            break;
        }

        case Balanced: {
            limits.maxRenderPixels   = 8000000;
            limits.maxTransmitPixels = 2000000;
            break;
        }

        case Sharp: {
            limits.maxRenderPixels   = 16000000;
            limits.maxTransmitPixels = 4000000;
            break;
        }
    }
}


void QTermViewerOptions::normalize() {
    cacheCapacity = qBound( 1, cacheCapacity, 64 );
    workerThreads = qBound( 1, workerThreads, 16 );

    limits.maxRenderWidth    = qBound( 64, limits.maxRenderWidth, QTERMDOC_MAX_RENDER_EDGE );
    limits.maxRenderPixels   = qBound<qint64>( 65536, limits.maxRenderPixels, 256000000 );
    limits.maxTransmitPixels = qBound<qint64>( 4096, limits.maxTransmitPixels, limits.maxRenderPixels );

    limits.minZoom  = qBound( 10, limits.minZoom, 100 );
    limits.maxZoom  = qBound( 100, limits.maxZoom, 1600 );
    limits.zoomStep = qBound( 1, limits.zoomStep, 100 );

    zoomPercent = QTermViewport::clampZoom( zoomPercent, limits );

    text.samplePages        = qBound( 0, text.samplePages, 50 );
    text.furnitureRatio     = qBound( 0.0, text.furnitureRatio, 1.0 );
    text.wordSpaceThreshold = qBound( 0.0, text.wordSpaceThreshold, 1000.0 );
    text.lineTolerance      = qBound( 0.0, text.lineTolerance, 100.0 );
}


QTermViewerOptions QTermViewerOptions::fromSettings( QSettings& settings ) {
    QTermViewerOptions opts;

    settings.beginGroup( "render" );
    opts.applyQuality( qualityFromName( settings.value( "quality" ).toString(), Balanced ) );
    readNumber( settings, "maxRenderPixels", opts.limits.maxRenderPixels );
    readNumber( settings, "maxRenderWidth", opts.limits.maxRenderWidth );
    readNumber( settings, "maxTransmitPixels", opts.limits.maxTransmitPixels );
    readNumber( settings, "cacheCapacity", opts.cacheCapacity );
    readNumber( settings, "workerThreads", opts.workerThreads );
    readBool( settings, "synchronous", opts.synchronous );

    bool grayscale = false;
    readBool( settings, "grayscale", grayscale );
    opts.colorMode = (grayscale ? QTermRenderOptions::Grayscale : QTermRenderOptions::Color);
    settings.endGroup();

    settings.beginGroup( "viewport" );
    readNumber( settings, "zoom", opts.zoomPercent );
    readNumber( settings, "minZoom", opts.limits.minZoom );
    readNumber( settings, "maxZoom", opts.limits.maxZoom );
    readNumber( settings, "zoomStep", opts.limits.zoomStep );
    settings.endGroup();

    settings.beginGroup( "text" );
    readNumber( settings, "samplePages", opts.text.samplePages );
    readNumber( settings, "furnitureRatio", opts.text.furnitureRatio );
    readNumber( settings, "wordSpaceThreshold", opts.text.wordSpaceThreshold );
    readNumber( settings, "lineTolerance", opts.text.lineTolerance );
    readBool( settings, "trimFurniture", opts.text.trimFurniture );
    opts.textMode = QTermTextEngine::modeFromName( settings.value( "mode" ).toString(), opts.textMode );
    settings.endGroup();

    settings.beginGroup( "reader" );
    opts.viewMode = viewModeFromName( settings.value( "mode" ).toString(), opts.viewMode );
    readBool( settings, "watchFile", opts.watchFile );
    settings.endGroup();

    opts.normalize();

    return opts;
}


QString QTermViewerOptions::qualityName( Quality preset ) {
    switch ( preset ) {
        case Fast: {
            return "fast";
        }

        case Balanced: {
            return "balanced";
        }

        case Sharp: {
            return "sharp";
        }
    }

    return "balanced";
}


QTermViewerOptions::Quality QTermViewerOptions::qualityFromName( QString name, Quality fallback ) {
    name = name.trimmed().toLower();

    if ( name == "fast" ) {
        return Fast;
    }

    if ( name == "balanced" ) {
        return Balanced;
    }

    if ( name == "sharp" ) {
        return Sharp;
    }

    return fallback;
}


QString QTermViewerOptions::viewModeName( ViewMode mode ) {
    return (mode == TextView ? "text" : "image");
}


QTermViewerOptions::ViewMode QTermViewerOptions::viewModeFromName( QString name, ViewMode fallback ) {
    name = name.trimmed().toLower();

    if ( name == "image" ) {
        return ImageView;
    }

    if ( name == "text" ) {
        return TextView;
    }

    return fallback;
}
